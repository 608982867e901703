#pragma once

#include "apkindex.hpp"
#include "index_cache.hpp"

#include <string>
#include <vector>
#include <map>
#include <unordered_set>
#include <filesystem>

// All providers of a package or capability across several index files, in
// index order. When two indexes have the same provider, the higher version
// wins. Throws PackageNotFoundError if nothing provides the name and
// must_exist is set.
ProviderMap providers(const std::string& name, const std::vector<std::filesystem::path>& indexes,
                      IndexCache& cache, bool must_exist = true);

// Providers with the highest provider_priority. Returns the input unchanged
// if none of them has a priority.
ProviderMap provider_highest_priority(const ProviderMap& providers, const std::string& name);

// Provider with the shortest pkgname, e.g. "mesa-egl" out of
// "mesa-purism-gc7000-egl, mesa-egl". The first one wins a tie.
PackageRecordPtr provider_shortest(const ProviderMap& providers, const std::string& name);

// The package of the same name, or else the shortest provider. Returns
// nullptr if not found and must_exist is false.
PackageRecordPtr package(const std::string& name, const std::vector<std::filesystem::path>& indexes,
                         IndexCache& cache, bool must_exist = true);

// Pick exactly one provider for `name` like apk would, stopping at the first
// rule that applies:
//   1. the only provider
//   2. the provider with the same pkgname
//   3. a provider that is going to be installed anyway
//   4. a provider that is installed already
//   5. the provider selected in the configuration
//   6. the provider with the highest provider_priority, if unique
//   7. the provider with the shortest pkgname
// apk would refuse to pick in the last case.
// Returns nullptr if there are no providers.
PackageRecordPtr select_provider(const std::string& name, const ProviderMap& providers,
                                 const std::unordered_set<std::string>& to_install,
                                 const std::unordered_set<std::string>& installed,
                                 const std::map<std::string, std::string>& selected_providers);
