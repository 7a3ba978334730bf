#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "codec/grid_codec.hpp"
#include "simulation/grid.hpp"
#include "simulation/ruleset.hpp"
#include "utility/exceptions.hpp"
#include "utility/logger.hpp"

using json = nlohmann::json;

/**
 * @brief Saves and loads grid files and keeps the per-user settings file.
 *
 * Grid files use the binary layout in codec/grid_codec.hpp. The settings file
 * is JSON and stores the recent files list, the last opened file and the
 * window geometry.
 */
class SaveManager {
  public:
    /**
     * @brief Window geometry restored at startup, in screen pixels.
     */
    struct WindowState {
        int width = 1280;
        int height = 900;
        int x = 0;
        int y = 0;
    };

    /**
     * @param config_path Settings file; defaults to
     * $HOME/.celleste/celleste_config.json
     */
    explicit SaveManager(std::filesystem::path config_path = default_config_path());
    ~SaveManager() = default;

    SaveManager(const SaveManager &) = delete;
    SaveManager &operator=(const SaveManager &) = delete;
    SaveManager(SaveManager &&) = delete;
    SaveManager &operator=(SaveManager &&) = delete;

    /**
     * @brief Writes grid and rule to a save file.
     * @throws celleste::IOError if the file cannot be written
     */
    void save_grid(const std::string &filepath, const Grid &grid,
                   const RuleSet &rule);

    /**
     * @brief Reads a save file.
     * @return Decoded grid and stored rule
     * @throws celleste::IOError if the file cannot be read
     * @throws celleste::MalformedSaveError if the content is not a valid save
     */
    codec::Snapshot load_grid(const std::string &filepath);

    /**
     * @brief Moves filepath to the front of the recent list, dropping the
     * oldest entry past MAX_RECENT_FILES.
     */
    void add_to_recent(const std::string &filepath);

    std::vector<std::string> get_recent_files() const;

    void clear_recent_files();

    /** @brief Last saved or loaded file, empty if none */
    std::string get_last_opened_file() const;

    void set_last_opened_file(const std::string &filepath);

    void save_window_state(const WindowState &state);

    /**
     * @brief Load previously saved window state.
     * @return Stored window state, defaults if there is none
     */
    WindowState load_window_state() const;

    inline const std::filesystem::path &config_path() const noexcept {
        return m_config_path;
    }

    /**
     * @brief $HOME/.celleste/celleste_config.json, falling back to the
     * working directory when no home directory is known.
     */
    static std::filesystem::path default_config_path();

  private:
    /**
     * @brief Reads the settings file; a missing or unreadable file yields an
     * empty object.
     */
    json read_config() const;

    /**
     * @brief Replaces the settings file with j.
     */
    void write_config(const json &j) const;

    /**
     * @brief Stores recent files and the last file in the settings file.
     */
    void save_config();

    void push_recent(const std::string &filepath);

    /**
     * @brief Makes filepath the last file and the newest recent entry with a
     * single settings write.
     */
    void remember_file(const std::string &filepath);

    void load_config();

    std::filesystem::path m_config_path;

    /** @brief Most recent first */
    std::vector<std::string> m_recent_files;
    std::string m_last_file;

    static constexpr std::size_t MAX_RECENT_FILES = 10;

    static constexpr const char *RECENT_FILES_KEY = "recent_files";
    static constexpr const char *LAST_FILE_KEY = "last_file";
    static constexpr const char *WINDOW_STATE_KEY = "window_state";

    static constexpr const char *CONFIG_FILE = "celleste_config.json";
};
