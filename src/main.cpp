#include "ClipIO.hpp"
#include "Config.hpp"
#include "Tracker.hpp"
#include "Visualizer.hpp"
#include <CLI/CLI.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>

int main(int argc, char** argv)
{
    // --config has to be known before the other defaults are filled in
    std::string ini_path = config_path_from_args(argc, argv, "defaults.ini");
    TrackerParams params;
    ClipOptions opts;
    try {
        IniFile ini = IniFile::load(ini_path);
        params = tracker_params_from(ini);
        opts   = clip_options_from(ini);
    } catch (const std::exception& e) {
        std::cerr << "Error in " << ini_path << ": " << e.what() << "\n";
        return 2;
    }

    CLI::App app{"Person tracker: detections in, stable track ids out"};
    app.add_option("--config", ini_path, "INI file with defaults");
    app.add_option("--input", opts.input, "Clip JSON with per-frame detections");
    app.add_option("--output", opts.output, "Output JSON path");
    app.add_option("--vis-dir", opts.vis_dir, "Visualization directory");
    app.add_option("--video-id", opts.video_id, "Clip id used in frame names");
    app.add_option("--person-class", opts.person_class, "Class id to keep (-1 keeps all)");
    app.add_option("--output-every", opts.output_every, "Write every n-th frame");
    app.add_option("--track-thresh", params.track_thresh, "Minimum detection score");
    app.add_option("--match-thresh", params.match_thresh, "Minimum IoU for a match");
    app.add_option("--max-age", params.max_age, "Max age before removing track");
    app.add_option("--min-hits", params.min_hits, "Hits before a track is reported");
    app.add_option("--nms-thresh", params.nms_thresh, "Duplicate suppression IoU (0 = off)");
    app.add_option("--associator", params.associator, "greedy or hungarian");
    CLI11_PARSE(app, argc, argv);

    if (opts.input.empty()) {
        std::cerr << "No input clip given (--input or [io] input)\n";
        return 2;
    }

    try {
        Clip clip = load_clip(opts.input, opts.person_class);
        if (clip.skipped > 0)
            std::cerr << "Warning: skipped " << clip.skipped << " degenerate detections\n";
        if (clip.filtered > 0)
            std::cout << "Dropped " << clip.filtered << " detections of other classes\n";
        if (clip.filled > 0)
            std::cout << "Filled " << clip.filled << " missing frame indices with empty frames\n";

        Tracker tracker(params);
        std::cout << "Tracking " << clip.frames.size() << " frames of " << opts.video_id
                  << " (" << tracker.associator().name() << " association)\n";

        SavedFrameFn on_saved;
        cv::Size canvas = clip_extent(clip);
        if (!opts.vis_dir.empty()) {
            std::filesystem::create_directories(opts.vis_dir);
            on_saved = [&](int idx, const std::vector<Label>& labels) {
                draw_vis(opts.vis_dir, idx, labels, canvas);
            };
        }

        auto records = track_clip(clip, tracker, opts.video_id, opts.output_every, on_saved);
        save_records(opts.output, records);

        std::cout << "Tracking complete. Frames: " << clip.frames.size()
                  << ", records: " << records.size()
                  << ", identities: " << group_tubes(records).size() << "\n";
        if (tracker.rejected_updates() > 0)
            std::cerr << "Warning: " << tracker.rejected_updates()
                      << " matched detections were rejected by the motion model\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
