#pragma once

#include "engine/Core.hpp"
#include "engine/StateCodec.hpp"

#include <filesystem>
#include <memory>
#include <optional>

namespace fl::storage
{
class Database;
}

namespace fl::engine
{

class PersistenceManager
{
  public:
    explicit PersistenceManager(std::filesystem::path path);
    ~PersistenceManager();

    PersistenceManager(PersistenceManager const &) = delete;
    PersistenceManager &operator=(PersistenceManager const &) = delete;

    bool is_valid() const noexcept;

    // Overlays stored settings on `defaults`; invalid stored values are
    // logged and skipped.
    CoreSettings load_settings(CoreSettings defaults) const;
    bool persist_settings(CoreSettings const &settings);

    // nullopt on a fresh install or an unreadable document.
    std::optional<PersistedState> load_state(Timestamp now) const;
    bool save_state(PersistedState const &state, Timestamp saved_at);

  private:
    std::optional<double> read_double_setting(char const *key) const;

    std::shared_ptr<storage::Database> database_;
};

} // namespace fl::engine
