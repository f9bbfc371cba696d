#pragma once
#include "Tracker.hpp"
#include <map>
#include <string>

/** Flat [section] key = value file. Comments start with # or ;. */
class IniFile
{
public:
    /** A missing file gives an empty IniFile. */
    static IniFile load(const std::string& path);
    static IniFile parse(const std::string& text);

    bool        has(const std::string& section, const std::string& key) const;
    std::string get(const std::string& section, const std::string& key,
                    const std::string& def = "") const;

    // Throw std::invalid_argument naming section and key for malformed numbers
    double get_double(const std::string& section, const std::string& key, double def) const;
    int    get_int(const std::string& section, const std::string& key, int def) const;

private:
    std::map<std::string, std::map<std::string, std::string>> values_;
};

/** Settings of the command-line driver; [io] section of the INI file. */
struct ClipOptions
{
    std::string input;
    std::string output       = "tracks.json";
    std::string vis_dir;                     // empty: no rendering
    std::string video_id     = "clip";
    int         person_class = -1;           // < 0: keep every class
    int         output_every = 1;            // write every n-th frame
};

TrackerParams tracker_params_from(const IniFile& ini, TrackerParams base = TrackerParams());
ClipOptions   clip_options_from(const IniFile& ini, ClipOptions base = ClipOptions());

/**
 * Value of --config in either "--config path" or "--config=path" form, or
 * def when absent. Needed before the INI defaults reach the CLI parser.
 */
std::string config_path_from_args(int argc, const char* const* argv, const std::string& def);
