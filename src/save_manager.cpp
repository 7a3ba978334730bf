#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

#ifndef _WIN32
#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#include "save_manager.hpp"

static std::string get_home_directory() {
#if defined(_WIN32)
    const char *home = getenv("USERPROFILE");
    if (home && *home) {
        return std::string(home);
    }
    const char *drive = getenv("HOMEDRIVE");
    const char *path = getenv("HOMEPATH");
    if (drive && path) {
        return std::string(drive) + std::string(path);
    }
    return std::string(".");
#else
    const char *home = getenv("HOME");
    if (home && *home) {
        return std::string(home);
    }
    struct passwd *pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }
    return std::string(".");
#endif
}

std::filesystem::path SaveManager::default_config_path() {
    return std::filesystem::path(get_home_directory()) / ".celleste" /
           CONFIG_FILE;
}

SaveManager::SaveManager(std::filesystem::path config_path)
    : m_config_path(std::move(config_path)) {
    load_config();
}

void SaveManager::save_grid(const std::string &filepath, const Grid &grid,
                            const RuleSet &rule) {
    LOG_INFO("Saving {}x{} grid ({} live) to {}", grid.width(), grid.height(),
             grid.live_count(), filepath);

    codec::write_file(filepath, codec::encode(grid, rule));
    remember_file(filepath);

    LOG_INFO("Grid saved successfully");
}

codec::Snapshot SaveManager::load_grid(const std::string &filepath) {
    LOG_INFO("Loading grid from {}", filepath);

    codec::Snapshot snapshot = codec::decode(codec::read_file(filepath));
    remember_file(filepath);

    LOG_INFO("Loaded {}x{} {} grid with {} live cells", snapshot.grid.width(),
             snapshot.grid.height(), to_string(snapshot.grid.edge_policy()),
             snapshot.grid.live_count());
    return snapshot;
}

void SaveManager::add_to_recent(const std::string &filepath) {
    push_recent(filepath);
    save_config();
}

void SaveManager::remember_file(const std::string &filepath) {
    push_recent(filepath);
    m_last_file = filepath;
    save_config();
}

void SaveManager::push_recent(const std::string &filepath) {
    auto it = std::find(m_recent_files.begin(), m_recent_files.end(), filepath);
    if (it != m_recent_files.end()) {
        m_recent_files.erase(it);
    }

    m_recent_files.insert(m_recent_files.begin(), filepath);

    if (m_recent_files.size() > MAX_RECENT_FILES) {
        m_recent_files.resize(MAX_RECENT_FILES);
    }
}

std::vector<std::string> SaveManager::get_recent_files() const {
    return m_recent_files;
}

void SaveManager::clear_recent_files() {
    m_recent_files.clear();
    save_config();
}

std::string SaveManager::get_last_opened_file() const { return m_last_file; }

void SaveManager::set_last_opened_file(const std::string &filepath) {
    m_last_file = filepath;
    save_config();
}

json SaveManager::read_config() const {
    std::ifstream file(m_config_path);
    if (!file.is_open()) {
        return json::object();
    }

    try {
        json j;
        file >> j;
        if (j.is_object()) {
            return j;
        }
        std::cerr << "Ignoring settings file " << m_config_path
                  << ": not a JSON object" << std::endl;
    } catch (const json::exception &e) {
        LOG_ERROR("Settings parse error: {}", e.what());
        std::cerr << "Ignoring unreadable settings file " << m_config_path
                  << ": " << e.what() << std::endl;
    }
    return json::object();
}

void SaveManager::write_config(const json &j) const {
    try {
        std::filesystem::create_directories(m_config_path.parent_path());

        std::ofstream out_file(m_config_path);
        if (!out_file.is_open()) {
            std::cerr << "Error saving config: cannot open " << m_config_path
                      << std::endl;
            return;
        }
        out_file << j.dump(2);
    } catch (const std::exception &e) {
        LOG_ERROR("Settings write error: {}", e.what());
        std::cerr << "Error saving config: " << e.what() << std::endl;
    }
}

void SaveManager::save_config() {
    json j = read_config();
    j[RECENT_FILES_KEY] = m_recent_files;
    j[LAST_FILE_KEY] = m_last_file;
    write_config(j);
}

void SaveManager::save_window_state(const WindowState &state) {
    json j = read_config();
    j[WINDOW_STATE_KEY] = {{"width", state.width},
                           {"height", state.height},
                           {"x", state.x},
                           {"y", state.y}};
    write_config(j);
}

SaveManager::WindowState SaveManager::load_window_state() const {
    WindowState state;
    const json j = read_config();

    if (!j.contains(WINDOW_STATE_KEY)) {
        return state;
    }

    try {
        const auto &ws = j[WINDOW_STATE_KEY];
        state.width = ws.value("width", state.width);
        state.height = ws.value("height", state.height);
        state.x = ws.value("x", state.x);
        state.y = ws.value("y", state.y);
    } catch (const json::exception &e) {
        std::cerr << "Error loading window state: " << e.what() << std::endl;
        return WindowState{};
    }
    return state;
}

void SaveManager::load_config() {
    LOG_INFO("Loading settings from {}", m_config_path.string());
    const json j = read_config();

    try {
        if (j.contains(RECENT_FILES_KEY)) {
            m_recent_files =
                j[RECENT_FILES_KEY].get<std::vector<std::string>>();
            if (m_recent_files.size() > MAX_RECENT_FILES) {
                m_recent_files.resize(MAX_RECENT_FILES);
            }
        }

        if (j.contains(LAST_FILE_KEY)) {
            m_last_file = j[LAST_FILE_KEY].get<std::string>();
        }
    } catch (const json::exception &e) {
        std::cerr << "Error loading config: " << e.what() << std::endl;
        m_recent_files.clear();
        m_last_file.clear();
    }
}
