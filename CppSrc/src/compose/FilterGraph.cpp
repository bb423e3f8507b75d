#include "../../include/compose/FilterGraph.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace vmx::compose {

namespace {

void appendEncoder(std::vector<std::string>& args) {
    args.insert(args.end(), {"-c:v", "libx264", "-preset", "fast",
                             "-c:a", "aac", "-ar", std::to_string(FilterGraph::kAudioRate), "-ac", "2",
                             "-r", std::to_string(FilterGraph::kFrameRate), "-vsync", "cfr"});
}

std::string drawtext(const std::string& text, int fontSize, const std::string& y,
                     const std::string& alpha, const std::string& color = "white") {
    std::ostringstream f;
    f << "drawtext=text='" << FilterGraph::escapeDrawtext(text) << "'"
      << ":fontsize=" << fontSize << ":fontcolor=" << color
      << ":x=(w-text_w)/2:y=" << y
      << ":borderw=2:bordercolor=black"
      << ":alpha='" << alpha << "'";
    return f.str();
}

std::string capitalize(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

} // namespace

std::string FilterGraph::num(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3) << value;
    std::string s = out.str();
    while (!s.empty() && s.back() == '0') s.pop_back();
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s.empty() || s == "-0" ? "0" : s;
}

std::string FilterGraph::escapeDrawtext(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "'\\''"; break;
            case ':': out += "\\:"; break;
            case '[': out += "\\["; break;
            case ']': out += "\\]"; break;
            default: out += ch;
        }
    }
    return out;
}

const std::vector<std::string>& FilterGraph::palette() {
    static const std::vector<std::string> names = {
        "fade", "dissolve", "fadeblack", "fadewhite", "circlecrop", "circleopen",
        "radial", "wipeleft", "wiperight", "smoothleft", "smoothright"
    };
    return names;
}

std::string FilterGraph::pickTransition(const std::string& configured, size_t joinIndex) {
    const auto& names = palette();
    if (std::find(names.begin(), names.end(), configured) != names.end()) {
        return configured;
    }
    return names[joinIndex % names.size()];
}

TranscodeCommand FilterGraph::introCommand(const core::ExportConfig& config, const std::string& dateText,
                                           const std::string& output) {
    const int w = config.width();
    const int h = config.height();
    const double d = config.introDuration;
    const std::string fadeIn = "if(lt(t,0.5),0,if(lt(t,1.5),(t-0.5),1))";

    std::ostringstream vf;
    vf << drawtext(config.introTitle, std::max(48, h / 10), "(h-text_h)/2-" + std::to_string(h / 12), fadeIn)
       << "," << drawtext(dateText, std::max(24, h / 24), "(h-text_h)/2+" + std::to_string(h / 12), fadeIn, "0xDDDDDD")
       << ",fade=t=in:st=0:d=0.5";

    TranscodeCommand cmd;
    cmd.label = "intro";
    cmd.outputPath = output;
    cmd.args = {
        "-f", "lavfi", "-i", "color=c=black:s=" + std::to_string(w) + "x" + std::to_string(h) + ":d=" + num(d),
        "-f", "lavfi", "-i", "anullsrc=r=" + std::to_string(kAudioRate) + ":cl=stereo",
        "-vf", vf.str(),
        "-af", "atrim=0:" + num(d) + ",afade=t=out:st=" + num(std::max(0.0, d - 1.0)) + ":d=1",
    };
    appendEncoder(cmd.args);
    cmd.args.insert(cmd.args.end(), {"-t", num(d), output});
    return cmd;
}

TranscodeCommand FilterGraph::outroCommand(const core::ExportConfig& config, const std::string& output) {
    const int w = config.width();
    const int h = config.height();
    const double d = config.outroDuration;
    const std::string last = num(std::max(0.0, d - 1.0));
    const std::string fadeOut = "if(lt(t," + last + "),1,1-(t-" + last + "))";

    std::ostringstream vf;
    vf << drawtext(config.outroMessage, std::max(36, h / 14), "(h-text_h)/2", fadeOut)
       << ",fade=t=out:st=" << last << ":d=1";

    TranscodeCommand cmd;
    cmd.label = "outro";
    cmd.outputPath = output;
    cmd.args = {
        "-f", "lavfi", "-i", "color=c=black:s=" + std::to_string(w) + "x" + std::to_string(h) + ":d=" + num(d),
        "-f", "lavfi", "-i", "anullsrc=r=" + std::to_string(kAudioRate) + ":cl=stereo",
        "-vf", vf.str(),
        "-af", "atrim=0:" + num(d) + ",afade=t=out:st=" + last + ":d=1",
    };
    appendEncoder(cmd.args);
    cmd.args.insert(cmd.args.end(), {"-t", num(d), output});
    return cmd;
}

TranscodeCommand FilterGraph::segmentCommand(const core::PlanEntry& entry, const std::string& source,
                                             const core::ExportConfig& config, const std::string& output) {
    const int w = config.width();
    const int h = config.height();
    const double duration = entry.segment.endTime - entry.segment.startTime;

    std::ostringstream vf;
    vf << "scale=" << w << ":" << h << ":force_original_aspect_ratio=decrease"
       << ",pad=" << w << ":" << h << ":(ow-iw)/2:(oh-ih)/2";

    if (config.textOverlay && duration > 2.0) {
        const double show = std::min(6.0, duration - 1.0);
        const std::string s = num(show);
        const std::string s1 = num(show - 1.0);
        const std::string alpha = "if(lt(t,1),t,if(lt(t," + s1 + "),1,1-(t-" + s1 + ")))";
        const std::string enable = ":enable='lt(t," + s + ")'";
        const int titleSize = std::max(28, h / 18);
        const int artistSize = std::max(20, h / 26);

        if (!entry.track.title.empty()) {
            vf << "," << drawtext(entry.track.title, titleSize, "h-" + std::to_string(h / 5), alpha) << enable;
        }
        if (!entry.track.artist.empty()) {
            vf << "," << drawtext(entry.track.artist, artistSize,
                                  "h-" + std::to_string(h / 5) + "+" + std::to_string(titleSize + 10),
                                  alpha, "0xDDDDDD") << enable;
        }
        if (!entry.track.language.empty()) {
            vf << ",drawtext=text='" << escapeDrawtext(capitalize(entry.track.language)) << "'"
               << ":fontsize=" << artistSize << ":fontcolor=white"
               << ":box=1:boxcolor=black@0.5:boxborderw=8"
               << ":x=w-text_w-20:y=20:alpha='" << alpha << "'" << enable;
        }
    }
    vf << ",setpts=PTS-STARTPTS";

    TranscodeCommand cmd;
    cmd.label = "segment " + entry.id();
    cmd.outputPath = output;
    cmd.args = {
        "-ss", num(entry.segment.startTime), "-i", source, "-t", num(duration),
        "-vf", vf.str(),
        "-af", "asetpts=PTS-STARTPTS",
    };
    appendEncoder(cmd.args);
    cmd.args.insert(cmd.args.end(), {"-async", "1", "-shortest", output});
    return cmd;
}

double FilterGraph::reconcileDuration(const StreamDurations& streams) {
    if (streams.video > 0.0 && streams.audio > 0.0) {
        return std::min(streams.video, streams.audio);
    }
    return std::max(streams.video, streams.audio);
}

TransitionPlan FilterGraph::planTransition(double firstLength, double secondLength, double requested) {
    TransitionPlan plan;
    plan.firstLength = firstLength;
    plan.secondLength = secondLength;

    const double cap = 0.4 * std::min(firstLength, secondLength);
    const double floor = std::min(2.0, cap);
    plan.duration = std::clamp(requested, floor, cap);
    plan.offset = std::max(0.0, firstLength - plan.duration);
    return plan;
}

std::string FilterGraph::transitionFilter(const TransitionPlan& plan, const std::string& transition) {
    const std::string d1 = num(plan.firstLength);
    const std::string d2 = num(plan.secondLength);
    const std::string td = num(plan.duration);
    const std::string off = num(plan.offset);
    const std::string delayMs = std::to_string(static_cast<long>(std::lround(plan.offset * 1000.0)));
    const std::string fps = std::to_string(kFrameRate);

    std::ostringstream f;
    f << "[0:v]trim=0:" << d1 << ",setpts=PTS-STARTPTS,fps=" << fps << "[v0];"
      << "[1:v]trim=0:" << d2 << ",setpts=PTS-STARTPTS,fps=" << fps << "[v1];"
      << "[0:a]atrim=0:" << d1 << ",asetpts=PTS-STARTPTS[a0];"
      << "[1:a]atrim=0:" << d2 << ",asetpts=PTS-STARTPTS[a1];"
      << "[v0][v1]xfade=transition=" << transition << ":duration=" << td << ":offset=" << off << "[v];"
      << "[a0]afade=t=out:st=" << off << ":d=" << td << "[a0f];"
      << "[a1]adelay=" << delayMs << "|" << delayMs << ",afade=t=in:st=0:d=" << td << "[a1f];"
      << "[a0f][a1f]amix=inputs=2:duration=longest:normalize=0[a]";
    return f.str();
}

TranscodeCommand FilterGraph::transitionCommand(const std::string& first, const std::string& second,
                                                const TransitionPlan& plan, const std::string& transition,
                                                const std::string& output) {
    TranscodeCommand cmd;
    cmd.label = "transition " + transition;
    cmd.outputPath = output;
    cmd.args = {
        "-i", first, "-i", second,
        "-filter_complex", transitionFilter(plan, transition),
        "-map", "[v]", "-map", "[a]",
    };
    appendEncoder(cmd.args);
    cmd.args.push_back(output);
    return cmd;
}

TranscodeCommand FilterGraph::trimCommand(const std::string& input, double length, const std::string& output) {
    TranscodeCommand cmd;
    cmd.label = "trim";
    cmd.outputPath = output;
    cmd.args = {"-i", input, "-t", num(length)};
    appendEncoder(cmd.args);
    cmd.args.push_back(output);
    return cmd;
}

std::string FilterGraph::concatList(const std::vector<std::string>& inputs) {
    std::ostringstream list;
    for (const auto& path : inputs) {
        std::string quoted;
        for (char ch : path) {
            if (ch == '\'') quoted += "'\\''";
            else quoted += ch;
        }
        list << "file '" << quoted << "'\n";
    }
    return list.str();
}

TranscodeCommand FilterGraph::concatCommand(const std::string& listPath, const std::string& output) {
    TranscodeCommand cmd;
    cmd.label = "concat";
    cmd.outputPath = output;
    cmd.args = {"-f", "concat", "-safe", "0", "-i", listPath};
    appendEncoder(cmd.args);
    cmd.args.push_back(output);
    return cmd;
}

std::string FilterGraph::duckingFilter(const std::vector<core::CommentaryCue>& cues, double duckLevel) {
    std::ostringstream f;
    f << "volume='if(";
    for (size_t i = 0; i < cues.size(); ++i) {
        if (i > 0) f << "+";
        f << "between(t," << num(cues[i].scheduledTime) << ","
          << num(cues[i].scheduledTime + cues[i].clipDuration) << ")";
    }
    if (cues.empty()) f << "0";
    f << "," << num(duckLevel) << ",1.0)':eval=frame";
    return f.str();
}

std::string FilterGraph::commentaryFilter(const std::vector<core::CommentaryCue>& cues,
                                          double duckLevel, double voiceGain) {
    std::ostringstream f;
    f << "[0:a]" << duckingFilter(cues, duckLevel) << "[music];";
    for (size_t i = 0; i < cues.size(); ++i) {
        const std::string ms = std::to_string(static_cast<long>(std::lround(cues[i].scheduledTime * 1000.0)));
        f << "[" << (i + 1) << ":a]adelay=" << ms << "|" << ms << "[dj" << (i + 1) << "];";
    }
    f << "[music]";
    for (size_t i = 0; i < cues.size(); ++i) f << "[dj" << (i + 1) << "]";

    // Voice gain is applied once, through the amix weights
    std::ostringstream weights;
    weights << "1";
    for (size_t i = 0; i < cues.size(); ++i) weights << " " << num(voiceGain);

    f << "amix=inputs=" << (cues.size() + 1)
      << ":duration=first:dropout_transition=0:normalize=0:weights='" << weights.str() << "'[aout]";
    return f.str();
}

TranscodeCommand FilterGraph::commentaryCommand(const std::string& video,
                                                const std::vector<core::CommentaryCue>& cues,
                                                double duckLevel, double voiceGain,
                                                const std::string& output) {
    TranscodeCommand cmd;
    cmd.label = "commentary";
    cmd.outputPath = output;
    cmd.args = {"-i", video};
    for (const auto& cue : cues) {
        cmd.args.insert(cmd.args.end(), {"-i", cue.clipPath});
    }
    cmd.args.insert(cmd.args.end(), {
        "-filter_complex", commentaryFilter(cues, duckLevel, voiceGain),
        "-map", "0:v", "-map", "[aout]",
        "-c:v", "libx264", "-preset", "fast",
        "-c:a", "aac", "-b:a", "192k",
        "-vsync", "cfr", "-r", std::to_string(kFrameRate),
        "-shortest", output
    });
    return cmd;
}

} // namespace vmx::compose
