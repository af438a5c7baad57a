#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <variant>
#include <vector>

#include "plugin.hpp"

namespace splash
{

using PluginHandle = std::shared_ptr<const IFormatPlugin>;

enum class RegistryErrc : uint8_t
{
  NotFound,
  AlreadyRegistered,
  IncompatibleVersion,
  Locked,
  InvalidPlugin
};

struct RegistryError
{
  RegistryErrc code;
  std::string plugin;
  std::string required;  // IncompatibleVersion only

  std::string Message() const;
};

// nullopt on success
using RegistryStatus = std::optional<RegistryError>;
using PluginLookup = std::variant<PluginHandle, RegistryError>;
using NameList = std::variant<std::vector<std::string>, RegistryError>;

// Named, versioned format plugins. Queries share the lock, mutations hold it
// exclusively, so readers never see a half-applied change. Handles returned by
// Get() stay valid after the plugin is unregistered.
class PluginRegistry
{
 public:
  PluginRegistry() = default;
  PluginRegistry(const PluginRegistry&) = delete;
  PluginRegistry& operator=(const PluginRegistry&) = delete;

  RegistryStatus Register(PluginHandle plugin);
  RegistryStatus Unregister(std::string_view name);

  PluginLookup Get(std::string_view name) const;

  // No ordering guarantee.
  NameList List() const;
  NameList ListEnabled() const;

  // 0 / false when the registry cannot be locked.
  size_t Count() const;
  bool Contains(std::string_view name) const;
  bool IsDisabled(std::string_view name) const;

  RegistryStatus Disable(std::string_view name);
  // Never fails for an unknown name; only a locking failure is reported.
  RegistryStatus Enable(std::string_view name);

  RegistryStatus VerifyVersion(std::string_view name, const PluginVersion& required) const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, PluginHandle> plugins_;
  std::unordered_set<std::string> disabled_;
};

}  // namespace splash
