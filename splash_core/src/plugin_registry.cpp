#include "splash/plugin_registry.hpp"

#include <mutex>
#include <system_error>

#include "splash/logger.hpp"

namespace splash
{

namespace
{

RegistryError MakeError(RegistryErrc code, std::string_view plugin)
{
  return RegistryError{code, std::string(plugin), {}};
}

void LogLockFailure(const std::system_error& e)
{
  LOG_ERROR("plugin registry lock failed: %s", e.what());
}

RegistryError LockedError(std::string_view plugin, const std::system_error& e)
{
  LogLockFailure(e);
  return MakeError(RegistryErrc::Locked, plugin);
}

}  // namespace

std::string RegistryError::Message() const
{
  switch (code)
  {
    case RegistryErrc::NotFound:
      return "Plugin '" + plugin + "' not found";
    case RegistryErrc::AlreadyRegistered:
      return "Plugin '" + plugin + "' is already registered";
    case RegistryErrc::IncompatibleVersion:
      return "Plugin '" + plugin + "' has incompatible version (required: " + required + ")";
    case RegistryErrc::Locked:
      return "Registry is locked for modifications";
    case RegistryErrc::InvalidPlugin:
      return "Plugin handle is empty";
  }
  return "Unknown registry error";
}

RegistryStatus PluginRegistry::Register(PluginHandle plugin)
{
  if (!plugin)
  {
    return MakeError(RegistryErrc::InvalidPlugin, {});
  }
  const std::string name = plugin->Name();

  try
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (plugins_.count(name) != 0)
    {
      return MakeError(RegistryErrc::AlreadyRegistered, name);
    }
    plugins_.emplace(name, std::move(plugin));
  }
  catch (const std::system_error& e)
  {
    return LockedError(name, e);
  }

  LOG_DEBUG("registered plugin '%s'", name.c_str());
  return std::nullopt;
}

RegistryStatus PluginRegistry::Unregister(std::string_view name)
{
  try
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end())
    {
      return MakeError(RegistryErrc::NotFound, name);
    }
    plugins_.erase(it);
  }
  catch (const std::system_error& e)
  {
    return LockedError(name, e);
  }
  return std::nullopt;
}

PluginLookup PluginRegistry::Get(std::string_view name) const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = plugins_.find(std::string(name));
    if (it == plugins_.end())
    {
      return MakeError(RegistryErrc::NotFound, name);
    }
    return it->second;
  }
  catch (const std::system_error& e)
  {
    return LockedError(name, e);
  }
}

NameList PluginRegistry::List() const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(plugins_.size());
    for (const auto& kv : plugins_)
    {
      names.push_back(kv.first);
    }
    return names;
  }
  catch (const std::system_error& e)
  {
    return LockedError({}, e);
  }
}

NameList PluginRegistry::ListEnabled() const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& kv : plugins_)
    {
      if (disabled_.count(kv.first) == 0)
      {
        names.push_back(kv.first);
      }
    }
    return names;
  }
  catch (const std::system_error& e)
  {
    return LockedError({}, e);
  }
}

size_t PluginRegistry::Count() const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_.size();
  }
  catch (const std::system_error& e)
  {
    LogLockFailure(e);
    return 0;
  }
}

bool PluginRegistry::Contains(std::string_view name) const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return plugins_.count(std::string(name)) != 0;
  }
  catch (const std::system_error& e)
  {
    LogLockFailure(e);
    return false;
  }
}

bool PluginRegistry::IsDisabled(std::string_view name) const
{
  try
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return disabled_.count(std::string(name)) != 0;
  }
  catch (const std::system_error& e)
  {
    LogLockFailure(e);
    return false;
  }
}

RegistryStatus PluginRegistry::Disable(std::string_view name)
{
  try
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::string key(name);
    if (plugins_.count(key) == 0)
    {
      return MakeError(RegistryErrc::NotFound, name);
    }
    disabled_.insert(std::move(key));
  }
  catch (const std::system_error& e)
  {
    return LockedError(name, e);
  }
  return std::nullopt;
}

RegistryStatus PluginRegistry::Enable(std::string_view name)
{
  try
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    disabled_.erase(std::string(name));
  }
  catch (const std::system_error& e)
  {
    return LockedError(name, e);
  }
  return std::nullopt;
}

RegistryStatus PluginRegistry::VerifyVersion(std::string_view name,
                                             const PluginVersion& required) const
{
  PluginLookup lookup = Get(name);
  if (auto* err = std::get_if<RegistryError>(&lookup))
  {
    return *err;
  }

  const PluginHandle& plugin = std::get<PluginHandle>(lookup);
  if (!plugin->Version().IsCompatibleWith(required))
  {
    return RegistryError{RegistryErrc::IncompatibleVersion, std::string(name),
                         required.ToString()};
  }
  return std::nullopt;
}

}  // namespace splash
