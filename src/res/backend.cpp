/// @file backend.cpp
/// @brief BackendRegistry implementation

#include <hoard/res/backend.hpp>
#include <hoard/core/log.hpp>

namespace hoard_res {

hoard_core::Result<void> BackendRegistry::register_backend(std::unique_ptr<Backend> backend) {
    if (!backend) {
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::InvalidArgument,
            "Cannot register a null backend"));
    }

    BackendKind kind = backend->kind();
    if (has(kind)) {
        return hoard_core::Err(hoard_core::Error(hoard_core::ErrorCode::AlreadyExists,
            std::string("Backend already registered for kind: ") + backend_kind_name(kind)));
    }

    hoard_core::res_logger()->debug("registered backend '{}' for {}", backend->name(), backend_kind_name(kind));
    m_backends.emplace(kind, std::move(backend));
    return hoard_core::Ok();
}

std::unique_ptr<Backend> BackendRegistry::unregister(BackendKind kind) {
    auto it = m_backends.find(kind);
    if (it == m_backends.end()) {
        return nullptr;
    }
    auto backend = std::move(it->second);
    m_backends.erase(it);
    return backend;
}

Backend* BackendRegistry::find(BackendKind kind) const {
    auto it = m_backends.find(kind);
    return it != m_backends.end() ? it->second.get() : nullptr;
}

std::vector<BackendKind> BackendRegistry::kinds() const {
    std::vector<BackendKind> result;
    result.reserve(m_backends.size());
    for (const auto& [kind, backend] : m_backends) {
        result.push_back(kind);
    }
    return result;
}

} // namespace hoard_res
