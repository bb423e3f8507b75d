#include "../../include/compose/Commentary.h"
#include "../../include/compose/Process.h"
#include "../../include/compose/Transcoder.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <stdexcept>
#include <vector>

namespace vmx::compose {

namespace {

std::string titleCase(std::string s) {
    bool start = true;
    for (char& ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        ch = static_cast<char>(start ? std::toupper(c) : std::tolower(c));
        start = std::isspace(c) != 0;
    }
    return s;
}

std::string countryFor(const std::string& language) {
    static const std::map<std::string, std::string> countries = {
        {"english", "the world"},
        {"hindi", "India"},
        {"malayalam", "Kerala"},
        {"tamil", "Tamil Nadu"},
        {"turkish", "Turkey"},
        {"uzbek", "Uzbekistan"},
        {"arabic", "the Middle East"},
    };
    std::string key = language;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = countries.find(key);
    return it != countries.end() ? it->second : titleCase(language);
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

std::string CommentaryPlanner::introText() {
    return "What's up party people! Your AI DJ is in the mix! Let's get this party started!";
}

std::string CommentaryPlanner::midText(const std::vector<std::string>& languages) {
    if (languages.size() >= 2) {
        std::string lang = languages[languages.size() / 2];
        if (lang.empty()) lang = "english";
        return "Now we're switching it up! " + titleCase(lang) + " vibes coming in hot! Keep that energy going!";
    }
    return "We're just getting warmed up! The vibes are immaculate! Keep that energy going!";
}

std::string CommentaryPlanner::outroText() {
    return "That's a wrap! Thanks for vibing with me! Until next time, stay groovy!";
}

std::string CommentaryPlanner::languageSwitchText(const std::string& language, size_t variant) {
    static const char* templates[] = {
        "Now let's travel to {country}!",
        "Taking you to {country} with this one!",
        "Switching it up! {language} vibes incoming!",
        "{language} music hitting different!",
        "Around the world we go! Next stop: {country}!",
    };
    std::string text = templates[variant % (sizeof(templates) / sizeof(templates[0]))];
    replaceAll(text, "{country}", countryFor(language));
    replaceAll(text, "{language}", titleCase(language));
    return text;
}

std::string CommentaryPlanner::peakText(size_t variant) {
    static const char* lines[] = {
        "This is the moment! Peak energy!",
        "We're at the top now! Feel it!",
        "Maximum vibes achieved!",
        "This is what we came for!",
    };
    return lines[variant % (sizeof(lines) / sizeof(lines[0]))];
}

std::string CommentaryPlanner::energyShiftText(double previous, double current, size_t variant) {
    static const std::vector<std::string> rising = {
        "Time to raise the energy!",
        "Here comes the heat!",
        "Get ready for this one!",
        "Big tune incoming!",
    };
    static const std::vector<std::string> falling = {
        "Let's cool it down for a moment...",
        "Taking it easy for this one...",
        "Vibe with me on this...",
        "Smooth vibes only...",
    };
    static const std::vector<std::string> smooth = {
        "Smooth transition coming up...",
        "Let's keep the flow going...",
        "Blending into the next one...",
        "Keeping it smooth...",
    };
    const double diff = current - previous;
    const std::vector<std::string>& lines = diff > kEnergyShift ? rising : diff < -kEnergyShift ? falling : smooth;
    return lines[variant % lines.size()];
}

double CommentaryPlanner::outroTime(double totalDuration) {
    return std::max(totalDuration - 8.0, totalDuration * 0.85);
}

std::vector<core::CommentaryCue> CommentaryPlanner::plan(const std::vector<std::string>& languages,
                                                          const std::vector<double>& energies,
                                                          const std::vector<double>& boundaries,
                                                          double totalDuration,
                                                          const core::CommentaryConfig& config) {
    std::vector<core::CommentaryCue> cues;
    if (totalDuration <= 0.0) return cues;

    auto add = [&cues](core::CueKind kind, double time, std::string text) {
        core::CommentaryCue cue;
        cue.kind = kind;
        cue.scheduledTime = time;
        cue.text = std::move(text);
        cues.push_back(std::move(cue));
    };

    add(core::CueKind::Intro, kIntroTime, introText());
    add(core::CueKind::Mid, totalDuration / 2.0, midText(languages));
    add(core::CueKind::Outro, outroTime(totalDuration), outroText());

    const bool haveEnergy = config.energyCues && energies.size() == languages.size() && !energies.empty();
    const size_t peak = haveEnergy
        ? static_cast<size_t>(std::max_element(energies.begin(), energies.end()) - energies.begin())
        : 0;

    const int maxTransitions = config.maxTransitionCues();
    int placed = 0;
    for (size_t b = 0; b < boundaries.size() && placed < maxTransitions; ++b) {
        const size_t next = b + 1;
        if (next >= languages.size()) break;

        const double t = boundaries[b];
        bool crowded = std::any_of(cues.begin(), cues.end(), [t](const core::CommentaryCue& c) {
            return std::abs(c.scheduledTime - t) < kMinCueSpacing;
        });
        if (crowded || t <= 0.0 || t >= totalDuration) continue;

        if (!languages[next].empty() && languages[next] != languages[b]) {
            add(core::CueKind::Transition, t, languageSwitchText(languages[next], b));
        } else if (haveEnergy && next == peak) {
            add(core::CueKind::Peak, t, peakText(b));
        } else if (haveEnergy) {
            add(core::CueKind::Transition, t, energyShiftText(energies[b], energies[next], b));
        } else {
            continue;
        }
        ++placed;
    }

    std::stable_sort(cues.begin(), cues.end(), [](const core::CommentaryCue& a, const core::CommentaryCue& b) {
        return a.scheduledTime < b.scheduledTime;
    });
    return cues;
}

// ----------------------------------------------------------------------------
// ScriptedVoiceProvider
// ----------------------------------------------------------------------------

ScriptedVoiceProvider::ScriptedVoiceProvider(std::string commandTemplate, ITranscoder& transcoder)
    : m_template(std::move(commandTemplate))
    , m_transcoder(transcoder) {}

std::optional<VoiceClip> ScriptedVoiceProvider::render(const core::CommentaryCue& cue,
                                                       const CommentaryContext& context,
                                                       const std::string& outputPath) {
    if (m_template.empty()) return std::nullopt;

    const std::string textFile = outputPath + ".txt";
    {
        std::ofstream out(textFile);
        if (!out) throw std::runtime_error("cannot write " + textFile);
        out << cue.text << '\n';
    }

    const std::string command = expandTemplate(m_template, {
        {"text_file", textFile}, {"output", outputPath}, {"voice", context.voice}
    });
    ProcessResult process = runShell(command);
    if (process.exitCode != 0) {
        throw std::runtime_error("tts command exited with " + std::to_string(process.exitCode));
    }

    std::error_code ec;
    if (!std::filesystem::exists(outputPath, ec)) {
        throw std::runtime_error("tts command produced no clip");
    }

    const double duration = m_transcoder.probeDuration(outputPath);
    if (duration <= 0.0) {
        throw std::runtime_error("voice clip has no duration");
    }
    return VoiceClip{outputPath, duration, cue.text};
}

} // namespace vmx::compose
