#include "providers.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"
#include "version.hpp"

ProviderMap providers(const std::string& name, const std::vector<fs::path>& indexes, IndexCache& cache, bool must_exist) {
    const std::string pkgname = remove_operators(name);

    ProviderMap ret;
    for (const auto& path : indexes) {
        const auto index = cache.parse(path, true);
        const ProviderMap* index_providers = index->find(pkgname);
        if (!index_providers) continue;

        for (const auto& [provider_pkgname, provider] : *index_providers) {
            if (auto last = ret.find(provider_pkgname)) {
                if (version_compare(provider->version, last->version) == -1) {
                    log_verbose(string_format("verbose.provider_lower", pkgname, provider_pkgname,
                                              provider->version, path.string(), last->version));
                    continue;
                }
            }
            log_verbose(string_format("verbose.provided_by_in", pkgname, provider_pkgname,
                                      provider->version, path.string()));
            ret.set(provider_pkgname, provider);
        }
    }

    if (ret.empty() && must_exist) {
        std::vector<std::string> searched;
        for (const auto& path : indexes) searched.push_back(path.string());
        log_debug(string_format("debug.searched_indexes", join(searched, ", ")));
        throw PackageNotFoundError(string_format("error.package_not_found", pkgname));
    }
    return ret;
}

ProviderMap provider_highest_priority(const ProviderMap& providers, const std::string& name) {
    int max_priority = 0;
    ProviderMap priority_providers;
    for (const auto& [provider_name, provider] : providers) {
        const int priority = provider->provider_priority.value_or(-1);
        if (priority > max_priority) {
            priority_providers.clear();
            max_priority = priority;
        }
        if (priority == max_priority) {
            priority_providers.set(provider_name, provider);
        }
    }

    if (priority_providers.empty()) {
        return providers;
    }
    log_debug(string_format("debug.highest_priority", name, max_priority, join(priority_providers.names(), ", ")));
    return priority_providers;
}

PackageRecordPtr provider_shortest(const ProviderMap& providers, const std::string& name) {
    if (providers.empty()) return nullptr;

    const ProviderMap::Entry* shortest = &providers.front();
    for (const auto& entry : providers) {
        if (entry.first.size() < shortest->first.size()) {
            shortest = &entry;
        }
    }
    if (providers.size() != 1) {
        log_debug(string_format("debug.picked_shortest", name, join(providers.names(), ", "), shortest->first));
    }
    return shortest->second;
}

PackageRecordPtr package(const std::string& name, const std::vector<fs::path>& indexes, IndexCache& cache, bool must_exist) {
    const ProviderMap package_providers = providers(name, indexes, cache, must_exist);
    if (auto same = package_providers.find(name)) {
        return same;
    }
    if (!package_providers.empty()) {
        return provider_shortest(package_providers, name);
    }
    // providers() has thrown already if must_exist is set
    return nullptr;
}

PackageRecordPtr select_provider(const std::string& name, const ProviderMap& providers,
                                 const std::unordered_set<std::string>& to_install,
                                 const std::unordered_set<std::string>& installed,
                                 const std::map<std::string, std::string>& selected_providers) {
    if (providers.empty()) {
        return nullptr;
    }

    log_verbose(string_format("verbose.provided_by", name, join(providers.names(), ", ")));
    if (providers.size() == 1) {
        return providers.front().second;
    }

    if (auto same = providers.find(name)) {
        log_verbose(string_format("verbose.choose_same_name", name));
        return same;
    }

    for (const auto& [provider_pkgname, provider] : providers) {
        if (to_install.contains(provider_pkgname)) {
            log_verbose(string_format("verbose.choose_to_install", name, provider_pkgname));
            return provider;
        }
    }

    for (const auto& [provider_pkgname, provider] : providers) {
        if (installed.contains(provider_pkgname)) {
            log_verbose(string_format("verbose.choose_installed", name, provider_pkgname));
            return provider;
        }
    }

    if (auto it = selected_providers.find(name); it != selected_providers.end()) {
        if (auto selected = providers.find(it->second)) {
            log_verbose(string_format("verbose.choose_selected", name, it->second));
            return selected;
        }
    }

    const ProviderMap priority_providers = provider_highest_priority(providers, name);
    if (priority_providers.size() == 1) {
        return priority_providers.front().second;
    }

    // apk itself would fail here
    return provider_shortest(priority_providers, name);
}
