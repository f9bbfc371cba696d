#include "Config.hpp"
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

using namespace std;

IniFile IniFile::load(const string& path)
{
    ifstream file(path);
    if (!file.is_open()) return IniFile();
    stringstream ss;
    ss << file.rdbuf();
    return parse(ss.str());
}

IniFile IniFile::parse(const string& text)
{
    IniFile ini;
    istringstream in(text);
    string line, current_section;
    regex section_re(R"(^\s*\[(.*?)\]\s*$)");
    regex keyval_re(R"(^\s*([^=#;]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");
    smatch match;

    while (getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (regex_match(line, match, section_re)) {
            current_section = match[1].str();
        } else if (regex_match(line, match, keyval_re)) {
            ini.values_[current_section][match[1].str()] = match[2].str();
        }
    }
    return ini;
}

bool IniFile::has(const string& section, const string& key) const
{
    auto s = values_.find(section);
    return s != values_.end() && s->second.count(key) > 0;
}

string IniFile::get(const string& section, const string& key, const string& def) const
{
    if (!has(section, key)) return def;
    return values_.at(section).at(key);
}

double IniFile::get_double(const string& section, const string& key, double def) const
{
    string v = get(section, key);
    if (v.empty()) return def;
    size_t used = 0;
    double out = 0.0;
    try {
        out = stod(v, &used);
    } catch (const logic_error&) {
        used = 0;
    }
    if (used != v.size())
        throw invalid_argument("[" + section + "] " + key + ": not a number: '" + v + "'");
    return out;
}

int IniFile::get_int(const string& section, const string& key, int def) const
{
    string v = get(section, key);
    if (v.empty()) return def;
    size_t used = 0;
    int out = 0;
    try {
        out = stoi(v, &used);
    } catch (const logic_error&) {
        used = 0;
    }
    if (used != v.size())
        throw invalid_argument("[" + section + "] " + key + ": not an integer: '" + v + "'");
    return out;
}

// -------- typed views --------------

TrackerParams tracker_params_from(const IniFile& ini, TrackerParams p)
{
    p.track_thresh = ini.get_double("tracker", "track-thresh", p.track_thresh);
    p.match_thresh = ini.get_double("tracker", "match-thresh", p.match_thresh);
    p.max_age      = ini.get_int("tracker", "max-age", p.max_age);
    p.min_hits     = ini.get_int("tracker", "min-hits", p.min_hits);
    p.nms_thresh   = ini.get_double("tracker", "nms-thresh", p.nms_thresh);
    p.associator   = ini.get("tracker", "associator", p.associator);
    return p;
}

ClipOptions clip_options_from(const IniFile& ini, ClipOptions o)
{
    o.input        = ini.get("io", "input", o.input);
    o.output       = ini.get("io", "output", o.output);
    o.vis_dir      = ini.get("io", "vis-dir", o.vis_dir);
    o.video_id     = ini.get("io", "video-id", o.video_id);
    o.person_class = ini.get_int("io", "person-class", o.person_class);
    o.output_every = ini.get_int("io", "output-every", o.output_every);
    return o;
}

string config_path_from_args(int argc, const char* const* argv, const string& def)
{
    const string flag = "--config";
    string path = def;
    for (int i = 1; i < argc; ++i) {
        string arg = argv[i];
        if (arg == flag && i + 1 < argc)
            path = argv[++i];
        else if (arg.compare(0, flag.size() + 1, flag + "=") == 0)
            path = arg.substr(flag.size() + 1);
    }
    return path;
}
