/**
 * @file builder.hpp
 * @brief Fixed topologies in one call: ChannelSetBuilder and config loading.
 *
 * A ChannelSet bundles one Receiver with the Senders of every channel it
 * was built with, each under a name. The layout either comes from code:
 *
 * @code
 *   auto set = mch::ChannelSetBuilder<Msg, int>()
 *                  .Add({"ctrl", 10, 1U, 4U, false})
 *                  .AddGroup(1, {{33U, false, {}}, {66U, false, {}}})
 *                  .Build();
 * @endcode
 *
 * or from a config file, one section per channel:
 *
 * @code
 *   [registry]
 *   seed = 42
 *   log_level = info
 *
 *   [channel.ctrl]
 *   priority = 10
 *   capacity = 4
 *
 *   [channel.bulk]
 *   priority = 1
 *   weight = 66
 * @endcode
 */

#ifndef MCH_BUILDER_HPP_
#define MCH_BUILDER_HPP_

#include "mch/config.hpp"
#include "mch/log.hpp"
#include "mch/receiver.hpp"
#include "mch/registry.hpp"
#include "mch/sender.hpp"
#include "mch/vocabulary.hpp"

#include <cstdint>
#include <cstdio>

#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mch {

// ============================================================================
// ChannelSpec / ChannelSet
// ============================================================================

template <typename P>
struct ChannelSpec {
  std::string name;
  P priority;
  uint32_t weight{1U};
  optional<uint32_t> capacity{};
  bool frozen{false};
};

template <typename T, typename P>
struct ChannelSet {
  Receiver<T, P> receiver;
  std::vector<Sender<T, P>> senders;  ///< In insertion order.
  std::vector<std::string> names;     ///< names[i] belongs to senders[i].

  /** @return The sender registered under @p name, or nullptr. */
  Sender<T, P>* Find(const std::string& name) {
    for (size_t i = 0; i < names.size(); ++i) {
      if (names[i] == name) return &senders[i];
    }
    return nullptr;
  }

  const Sender<T, P>* Find(const std::string& name) const {
    for (size_t i = 0; i < names.size(); ++i) {
      if (names[i] == name) return &senders[i];
    }
    return nullptr;
  }
};

// ============================================================================
// ChannelSetBuilder
// ============================================================================

template <typename T, typename P>
class ChannelSetBuilder final {
 public:
  ChannelSetBuilder& WithConfig(const RegistryConfig& cfg) {
    cfg_ = cfg;
    return *this;
  }

  ChannelSetBuilder& Add(const ChannelSpec<P>& spec) {
    specs_.push_back(spec);
    if (specs_.back().name.empty()) {
      specs_.back().name = "ch" + std::to_string(specs_.size() - 1U);
    }
    return *this;
  }

  ChannelSetBuilder& Add(const P& priority, uint32_t weight = 1U,
                         optional<uint32_t> capacity = {},
                         bool frozen = false) {
    return Add(ChannelSpec<P>{std::string(), priority, weight, capacity, frozen});
  }

  /** @brief Several channels sharing one priority level. */
  ChannelSetBuilder& AddGroup(const P& priority,
                              std::initializer_list<ChannelOptions> group) {
    for (const ChannelOptions& opts : group) {
      Add(priority, opts.weight, opts.capacity, opts.frozen);
    }
    return *this;
  }

  size_t Size() const noexcept { return specs_.size(); }

  /** @brief Create the registry and every channel, in insertion order. */
  ChannelSet<T, P> Build() const {
    ChannelSet<T, P> set{Receiver<T, P>(cfg_), {}, {}};
    set.senders.reserve(specs_.size());
    set.names.reserve(specs_.size());
    for (const ChannelSpec<P>& spec : specs_) {
      set.senders.push_back(set.receiver.NewChannel(
          spec.priority, spec.weight, spec.frozen, spec.capacity));
      set.names.push_back(spec.name);
    }
    MCH_LOG_INFO("Builder", "[%s] built %zu channel(s) on %zu priority level(s)",
                 cfg_.name.c_str(), set.senders.size(),
                 set.receiver.PriorityLevelCount());
    return set;
  }

 private:
  RegistryConfig cfg_;
  std::vector<ChannelSpec<P>> specs_;
};

// ============================================================================
// Config Loading
// ============================================================================

namespace detail {

static constexpr const char kChannelSectionPrefix[] = "channel.";
static constexpr size_t kChannelSectionPrefixLen =
    sizeof(kChannelSectionPrefix) - 1U;

/// Reads `[registry]`; the log level is returned, not applied.
inline expected<void, ConfigError> ReadRegistrySection(
    const ConfigStore& cfg, RegistryConfig& out, optional<log::Level>& level) {
  if (!cfg.HasSection("registry")) {
    return expected<void, ConfigError>::success();
  }

  if (cfg.HasKey("registry", "seed")) {
    auto seed = cfg.FindUint("registry", "seed");
    if (!seed.has_value()) {
      MCH_LOG_ERROR("Config", "registry.seed must be a non-negative integer");
      return expected<void, ConfigError>::error(seed.get_error());
    }
    out.seed = seed.value();
  }

  if (cfg.HasKey("registry", "name")) {
    out.name = cfg.GetString("registry", "name");
  }

  if (cfg.HasKey("registry", "log_level")) {
    const char* name = cfg.GetString("registry", "log_level");
    log::Level parsed = log::Level::kInfo;
    if (!log::LevelFromString(name, parsed)) {
      MCH_LOG_ERROR("Config", "unknown registry.log_level '%s'", name);
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    level = optional<log::Level>(parsed);
  }
  return expected<void, ConfigError>::success();
}

template <typename P>
expected<ChannelSpec<P>, ConfigError> ReadChannelSection(const ConfigStore& cfg,
                                                         const char* section) {
  using Result = expected<ChannelSpec<P>, ConfigError>;

  if (!cfg.HasKey(section, "priority")) {
    MCH_LOG_ERROR("Config", "[%s] missing 'priority'", section);
    return Result::error(ConfigError::kMissingKey);
  }
  optional<int32_t> priority = cfg.FindInt(section, "priority");
  if (!priority.has_value()) {
    MCH_LOG_ERROR("Config", "[%s] priority '%s' is not an integer", section,
                  cfg.GetString(section, "priority"));
    return Result::error(ConfigError::kInvalidValue);
  }

  ChannelSpec<P> spec{std::string(section + kChannelSectionPrefixLen),
                      static_cast<P>(priority.value()),
                      1U,
                      {},
                      cfg.GetBool(section, "frozen", false)};

  if (cfg.HasKey(section, "weight")) {
    auto weight = cfg.FindUint(section, "weight");
    if (!weight.has_value()) {
      MCH_LOG_ERROR("Config", "[%s] weight '%s' is not a non-negative integer",
                    section, cfg.GetString(section, "weight"));
      return Result::error(weight.get_error());
    }
    spec.weight = weight.value();
  }

  if (cfg.HasKey(section, "capacity")) {
    auto capacity = cfg.FindUint(section, "capacity");
    if (!capacity.has_value()) {
      MCH_LOG_ERROR("Config",
                    "[%s] capacity '%s' is not a non-negative integer", section,
                    cfg.GetString(section, "capacity"));
      return Result::error(capacity.get_error());
    }
    // 0 = unbounded
    if (capacity.value() > 0U) {
      spec.capacity = optional<uint32_t>(capacity.value());
    }
  }
  return Result::success(std::move(spec));
}

}  // namespace detail

/**
 * @brief Build a ChannelSet from the `channel.<name>` sections of @p cfg.
 *
 * Keys per channel: `priority` (required, converted with static_cast),
 * `weight` (default 1), `capacity` (absent or 0 = unbounded), `frozen`
 * (default false). An optional `[registry]` section supplies `name`, `seed`
 * and `log_level`. Other named sections are skipped with a warning.
 *
 * @return kMissingKey when a channel has no priority, kInvalidValue for a
 *         value of the wrong shape; nothing is built in either case.
 */
template <typename T, typename P>
expected<ChannelSet<T, P>, ConfigError> LoadChannelSet(const ConfigStore& cfg) {
  using Result = expected<ChannelSet<T, P>, ConfigError>;

  RegistryConfig reg_cfg;
  optional<log::Level> level;
  auto reg = detail::ReadRegistrySection(cfg, reg_cfg, level);
  if (!reg.has_value()) {
    return Result::error(reg.get_error());
  }

  ChannelSetBuilder<T, P> builder;
  builder.WithConfig(reg_cfg);

  const uint32_t sections = cfg.SectionCount();
  for (uint32_t i = 0; i < sections; ++i) {
    const char* section = cfg.SectionAt(i);
    if (!detail::NameHasPrefix(section, detail::kChannelSectionPrefix)) {
      if (section[0] != '\0' && !detail::NameEqual(section, "registry")) {
        MCH_LOG_WARN("Config", "skipping unknown section [%s]", section);
      }
      continue;
    }
    if (section[detail::kChannelSectionPrefixLen] == '\0') {
      MCH_LOG_ERROR("Config", "channel section without a name");
      return Result::error(ConfigError::kInvalidValue);
    }

    auto spec = detail::ReadChannelSection<P>(cfg, section);
    if (!spec.has_value()) {
      return Result::error(spec.get_error());
    }
    builder.Add(spec.value());
  }

  if (builder.Size() == 0U) {
    MCH_LOG_WARN("Config", "no [channel.*] section found");
  }
  // Only a fully valid topology touches the global log level.
  if (level.has_value()) {
    log::SetLevel(level.value());
  }
  return Result::success(builder.Build());
}

/**
 * @brief Load @p path (format by extension) and build its ChannelSet.
 * @return The parser error, or any error of LoadChannelSet().
 */
template <typename T, typename P>
expected<ChannelSet<T, P>, ConfigError> LoadChannelSetFile(const char* path) {
  using Result = expected<ChannelSet<T, P>, ConfigError>;

  auto cfg = std::make_unique<MultiConfig>();
  auto r = cfg->LoadFile(path);
  if (!r.has_value()) {
    MCH_LOG_ERROR("Config", "failed to load %s: %s", path,
                  ConfigErrorToString(r.get_error()));
    return Result::error(r.get_error());
  }
  return LoadChannelSet<T, P>(*cfg);
}

}  // namespace mch

#endif  // MCH_BUILDER_HPP_
