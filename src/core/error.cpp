/// @file error.cpp
/// @brief Error formatting and Result instantiations for hoard_core

#include <hoard/core/error.hpp>
#include <sstream>
#include <vector>

namespace hoard_core {

namespace {

std::string format_handle_error(const HandleError& err) {
    std::ostringstream oss;
    oss << "[HandleError] " << err.message;
    return oss.str();
}

} // anonymous namespace

// =============================================================================
// Error Chain
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;
    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, HandleError>) {
            oss << format_handle_error(err);
        }
    }, error.variant());

    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=\"" << value << "\"";
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::uint8_t>, Error>;

} // namespace hoard_core
