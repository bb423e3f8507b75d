#include "../../include/compose/CompositionPipeline.h"
#include "../../include/compose/Commentary.h"
#include "../../include/compose/FilterGraph.h"
#include "../../include/compose/Sources.h"
#include "../../include/core/Errors.h"
#include "../../include/core/JsonContract.h"
#include "../../include/core/StrategyChain.h"
#include "../../include/core/TempDir.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace vmx::compose {

struct CompositionPipeline::RunState {
    core::CompositionJob job;
    const std::atomic<bool>& cancelled;
    ProgressObserver observer;
    std::unique_ptr<core::ScopedTempDir> dir;

    std::vector<std::string> segmentClips;
    std::vector<std::string> segmentLanguages;
    std::vector<double> segmentEnergies;      ///< 0-1
};

CompositionPipeline::CompositionPipeline(core::MixConfig config, ITranscoder& transcoder, SourceCache& sources,
                                         std::vector<ICommentaryProvider*> voiceProviders)
    : m_config(std::move(config))
    , m_transcoder(transcoder)
    , m_sources(sources)
    , m_voiceProviders(std::move(voiceProviders)) {}

core::CompositionJob CompositionPipeline::run(const std::string& jobId, const core::MixPlan& plan,
                                              const std::atomic<bool>& cancelled,
                                              ProgressObserver observer) {
    RunState st{core::CompositionJob{}, cancelled, std::move(observer), nullptr, {}, {}};
    st.job.id = jobId;
    st.job.totalSegments = static_cast<int>(plan.size());

    auto start = std::chrono::high_resolution_clock::now();
    std::cout << "[Compose] Job " << jobId << ": " << plan.size() << " planned segments" << std::endl;

    try {
        if (plan.empty()) {
            throw core::StageError("input", "empty mix plan");
        }
        for (const auto& entry : plan.entries) {
            if (!entry.segment.isValid() || entry.track.sourceId.empty()) {
                throw core::StageError("input", "invalid plan entry '" + entry.id() + "'");
            }
        }

        checkCancelled(st, "setup");
        st.dir = std::make_unique<core::ScopedTempDir>("vmx_" + sanitizeSourceId(jobId),
                                                       m_config.exports.workDir);

        std::optional<std::string> intro;
        if (m_config.exports.intro) {
            intro = renderCard(st, true);
        }
        report(st, core::JobStatus::Downloading, 5.0, "intro");

        renderSegments(st, plan);

        const int survivors = static_cast<int>(st.segmentClips.size());
        if (survivors < m_config.exports.minSegments) {
            throw core::StageError("segments", "only " + std::to_string(survivors) + " of " +
                                   std::to_string(plan.size()) + " segments rendered, need " +
                                   std::to_string(m_config.exports.minSegments));
        }

        checkCancelled(st, "outro");
        std::optional<std::string> outro;
        if (m_config.exports.outro) {
            outro = renderCard(st, false);
        }
        report(st, core::JobStatus::Processing, 82.0, "outro");

        std::vector<std::string> clips;
        if (intro) clips.push_back(*intro);
        clips.insert(clips.end(), st.segmentClips.begin(), st.segmentClips.end());
        if (outro) clips.push_back(*outro);

        checkCancelled(st, "transitions");
        report(st, core::JobStatus::Concatenating, 84.0, "joining " + std::to_string(clips.size()) + " clips");
        std::vector<double> starts;
        std::string mixed = joinClips(st, clips, starts);

        // Timeline position where each segment after the first begins
        std::vector<double> boundaries;
        const size_t firstSegment = intro ? 1 : 0;
        for (size_t i = 1; i < st.segmentClips.size(); ++i) {
            boundaries.push_back(starts[firstSegment + i]);
        }

        if (m_config.commentary.enabled) {
            checkCancelled(st, "commentary");
            mixed = addCommentary(st, mixed, boundaries);
        }

        checkCancelled(st, "finalize");
        finalize(st, mixed);
    } catch (const core::CancelledError& e) {
        std::cout << "[Compose] Job " << jobId << " " << e.what() << std::endl;
        st.job.status = core::JobStatus::Cancelled;
        st.job.currentStage = e.stage();
        if (st.observer) {
            st.observer({st.job.status, st.job.progress, st.job.currentStage,
                         st.job.segmentIndex, st.job.totalSegments, std::nullopt});
        }
    } catch (const core::StageError& e) {
        st.job.status = core::JobStatus::Failed;
        st.job.error = e.stage() + ": " + e.what();
        std::cerr << "[Compose] Job " << jobId << " failed: " << *st.job.error << std::endl;
        if (st.observer) {
            st.observer({st.job.status, st.job.progress, e.stage(),
                         st.job.segmentIndex, st.job.totalSegments, st.job.error});
        }
    } catch (const std::exception& e) {
        st.job.status = core::JobStatus::Failed;
        st.job.error = std::string("pipeline: ") + e.what();
        std::cerr << "[Compose] Job " << jobId << " failed: " << *st.job.error << std::endl;
        if (st.observer) {
            st.observer({st.job.status, st.job.progress, "pipeline",
                         st.job.segmentIndex, st.job.totalSegments, st.job.error});
        }
    }

    // Working directory goes away here whatever the outcome
    st.dir.reset();

    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    std::cout << "[Compose] Job " << jobId << " " << core::toString(st.job.status)
              << " in " << duration.count() << "ms" << std::endl;
    return st.job;
}

// ----------------------------------------------------------------------------
// Stages
// ----------------------------------------------------------------------------

std::optional<std::string> CompositionPipeline::renderCard(RunState& st, bool intro) {
    const std::string output = st.dir->file(intro ? "intro.mp4" : "outro.mp4").string();
    TranscodeCommand command = intro
        ? FilterGraph::introCommand(m_config.exports, dateText(), output)
        : FilterGraph::outroCommand(m_config.exports, output);

    TranscodeResult result = invoke(st, command);
    if (!result.ok) {
        warn(st, std::string(intro ? "intro" : "outro") + ": card rendering failed, continuing without it");
        return std::nullopt;
    }
    return output;
}

void CompositionPipeline::renderSegments(RunState& st, const core::MixPlan& plan) {
    const size_t n = plan.size();
    for (size_t i = 0; i < n; ++i) {
        const core::PlanEntry& entry = plan.entries[i];
        const int index = static_cast<int>(i) + 1;
        const double base = 10.0 + 70.0 * static_cast<double>(i) / static_cast<double>(n);
        const std::string tag = "segment " + std::to_string(index) + "/" + std::to_string(n);

        checkCancelled(st, tag);
        report(st, core::JobStatus::Downloading, base, "downloading " + tag, index);

        FetchResult source = m_sources.get(entry.track.sourceId);
        if (!source.ok) {
            warn(st, tag + " (" + entry.id() + "): source unavailable: " + source.error);
            continue;
        }

        report(st, core::JobStatus::Processing, base + 1.0, "processing " + tag, index);
        const std::string output = st.dir->file("segment_" + std::to_string(i) + ".mp4").string();
        TranscodeResult result = invoke(st, FilterGraph::segmentCommand(entry, source.path, m_config.exports, output));
        if (!result.ok) {
            warn(st, tag + " (" + entry.id() + "): extraction failed (exit " + std::to_string(result.exitCode) + ")");
            continue;
        }

        st.segmentClips.push_back(output);
        st.segmentLanguages.push_back(entry.track.language);
        st.segmentEnergies.push_back(entry.track.energyScore / 100.0);
        report(st, core::JobStatus::Processing, base + 3.0, tag + " ready", index);
    }
    std::cout << "[Compose] " << st.segmentClips.size() << " of " << n << " segments rendered" << std::endl;
}

std::string CompositionPipeline::joinClips(RunState& st, const std::vector<std::string>& clips,
                                           std::vector<double>& starts) {
    starts.assign(clips.size(), 0.0);
    if (clips.size() == 1) return clips.front();

    const double requested = m_config.exports.crossfadeDuration;
    if (requested <= 0.0) {
        double position = 0.0;
        for (size_t i = 0; i < clips.size(); ++i) {
            starts[i] = position;
            position += clipLength(clips[i]);
        }
        const std::string output = st.dir->file("joined.mp4").string();
        if (!plainConcat(st, clips, output)) {
            throw core::StageError("transitions", "concatenation failed");
        }
        return output;
    }

    std::string accumulated = clips.front();
    double accumulatedLength = clipLength(accumulated);

    for (size_t k = 1; k < clips.size(); ++k) {
        checkCancelled(st, "transitions");
        const std::string& next = clips[k];
        const double nextLength = clipLength(next);
        const std::string output = st.dir->file("join_" + std::to_string(k) + ".mp4").string();
        const std::string transition = FilterGraph::pickTransition(m_config.exports.transition, k - 1);
        const TransitionPlan plan = FilterGraph::planTransition(accumulatedLength, nextLength, requested);

        core::StrategyChain<double> join;
        join.add("xfade " + transition, [&]() -> std::optional<double> {
            if (accumulatedLength <= 0.0 || nextLength <= 0.0) return std::nullopt;
            std::cout << "[Transition] " << transition << ": first=" << accumulatedLength
                      << "s second=" << nextLength << "s duration=" << plan.duration
                      << "s offset=" << plan.offset << "s" << std::endl;
            TranscodeResult r = invoke(st, FilterGraph::transitionCommand(accumulated, next, plan, transition, output));
            if (!r.ok) return std::nullopt;
            return plan.offset;
        });
        join.add("concat", [&]() -> std::optional<double> {
            if (!plainConcat(st, {accumulated, next}, output)) return std::nullopt;
            return accumulatedLength;
        });

        std::optional<double> nextStart = join.run();
        if (!nextStart) {
            throw core::StageError("transitions", "could not join clip " + std::to_string(k + 1) +
                                   " of " + std::to_string(clips.size()));
        }
        if (join.winner() == "concat") {
            warn(st, "transition " + std::to_string(k) + ": " + transition + " failed, joined with plain concatenation");
        }

        starts[k] = *nextStart;
        accumulated = output;
        const double joinedLength = clipLength(output);
        accumulatedLength = joinedLength > 0.0 ? joinedLength : *nextStart + nextLength;
    }
    return accumulated;
}

bool CompositionPipeline::plainConcat(RunState& st, const std::vector<std::string>& inputs,
                                      const std::string& output) {
    std::vector<std::string> fixed;
    for (size_t i = 0; i < inputs.size(); ++i) {
        StreamDurations streams = m_transcoder.probeStreams(inputs[i]);
        if (streams.video > 0.0 && streams.audio > 0.0 && std::abs(streams.video - streams.audio) > 0.1) {
            const std::string trimmed = st.dir->file("fixed_" + std::to_string(i) + "_" +
                                                     fs::path(inputs[i]).filename().string()).string();
            TranscodeResult r = invoke(st, FilterGraph::trimCommand(inputs[i], std::min(streams.video, streams.audio),
                                                                    trimmed));
            fixed.push_back(r.ok ? trimmed : inputs[i]);
        } else {
            fixed.push_back(inputs[i]);
        }
    }

    const fs::path listPath = fs::path(output).replace_extension(".txt");
    {
        std::ofstream list(listPath);
        if (!list) {
            std::cerr << "[Compose] Cannot write concat list " << listPath << std::endl;
            return false;
        }
        list << FilterGraph::concatList(fixed);
    }
    return invoke(st, FilterGraph::concatCommand(listPath.string(), output)).ok;
}

std::string CompositionPipeline::addCommentary(RunState& st, const std::string& video,
                                               const std::vector<double>& boundaries) {
    const core::CommentaryConfig& cfg = m_config.commentary;
    report(st, core::JobStatus::Encoding, 88.0, "commentary");

    try {
        const double total = FilterGraph::reconcileDuration(m_transcoder.probeStreams(video));
        std::vector<core::CommentaryCue> cues =
            CommentaryPlanner::plan(st.segmentLanguages, st.segmentEnergies, boundaries, total, cfg);
        if (cues.empty()) {
            warn(st, "commentary: mix duration unknown, skipping commentary");
            return video;
        }

        std::vector<core::CommentaryCue> rendered;
        for (size_t i = 0; i < cues.size(); ++i) {
            checkCancelled(st, "commentary");
            core::CommentaryCue cue = cues[i];
            CommentaryContext context{cfg.voice, cfg.theme, cfg.mood, {}};
            if (!st.segmentLanguages.empty()) {
                size_t at = static_cast<size_t>(std::upper_bound(boundaries.begin(), boundaries.end(),
                                                                 cue.scheduledTime) - boundaries.begin());
                context.language = st.segmentLanguages[std::min(at, st.segmentLanguages.size() - 1)];
            }
            const std::string clipPath = st.dir->file("dj_" + std::to_string(i) + ".wav").string();

            core::StrategyChain<VoiceClip> voices;
            for (ICommentaryProvider* provider : m_voiceProviders) {
                voices.add(provider->name(), [provider, &cue, &context, &clipPath]() {
                    return provider->render(cue, context, clipPath);
                });
            }
            std::optional<VoiceClip> clip = voices.run();
            checkCancelled(st, "commentary");
            if (!clip) {
                std::cerr << "[Commentary] No voice for " << core::toString(cue.kind) << " cue";
                for (const auto& note : voices.notes()) std::cerr << " | " << note;
                std::cerr << std::endl;
            } else {
                cue.clipPath = clip->path;
                cue.clipDuration = clip->duration;
                rendered.push_back(cue);
                std::cout << "[Commentary] " << core::toString(cue.kind) << " at " << cue.scheduledTime
                          << "s (" << cue.clipDuration << "s) via " << voices.winner() << std::endl;
            }
            report(st, core::JobStatus::Encoding,
                   88.0 + 8.0 * static_cast<double>(i + 1) / static_cast<double>(cues.size()), "commentary");
        }

        if (rendered.empty()) {
            warn(st, "commentary: no voice clips rendered, shipping without commentary");
            return video;
        }

        const std::string output = st.dir->file("commentary.mp4").string();
        TranscodeResult result = invoke(st, FilterGraph::commentaryCommand(video, rendered, cfg.duckLevel,
                                                                           cfg.voiceGain, output));
        report(st, core::JobStatus::Encoding, 98.0, "commentary mixed");
        if (!result.ok) {
            warn(st, "commentary: overlay failed, shipping without commentary");
            return video;
        }
        return output;
    } catch (const core::CancelledError&) {
        throw;
    } catch (const std::exception& e) {
        warn(st, std::string("commentary: ") + e.what());
        return video;
    }
}

void CompositionPipeline::finalize(RunState& st, const std::string& video) {
    report(st, core::JobStatus::Encoding, 99.0, "finalizing");

    const fs::path exportsDir = m_config.exports.exportsDir;
    std::error_code ec;
    fs::create_directories(exportsDir, ec);
    if (ec) {
        throw core::StageError("finalize", "cannot create " + exportsDir.string() + ": " + ec.message());
    }

    const fs::path target = exportsDir / (m_config.exports.outputName + ".mp4");
    fs::rename(video, target, ec);
    if (ec) {
        // Temp dir on another filesystem
        ec.clear();
        fs::copy_file(video, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw core::StageError("finalize", "cannot move output to " + target.string() + ": " + ec.message());
        }
    }

    st.job.outputPath = target.string();
    st.job.durationSeconds = m_transcoder.probeDuration(target.string());
    st.job.fileSizeBytes = fs::file_size(target, ec);
    if (ec) st.job.fileSizeBytes = 0;

    st.job.status = core::JobStatus::Complete;
    st.job.progress = 100.0;
    st.job.currentStage = "complete";

    const fs::path record = exportsDir / (m_config.exports.outputName + ".job.json");
    std::ofstream out(record);
    if (out) {
        out << core::JsonContract::createJobRecord(st.job).dump(2);
    } else {
        st.job.warnings.push_back("finalize: cannot write " + record.string());
        std::cerr << "[Compose] Cannot write job record " << record << std::endl;
    }

    std::cout << "[Compose] Output: " << target.string() << " (" << st.job.durationSeconds << "s, "
              << st.job.fileSizeBytes << " bytes)" << std::endl;
    if (st.observer) {
        st.observer({st.job.status, st.job.progress, st.job.currentStage,
                     st.job.segmentIndex, st.job.totalSegments, std::nullopt});
    }
}

// ----------------------------------------------------------------------------
// Helpers
// ----------------------------------------------------------------------------

TranscodeResult CompositionPipeline::invoke(RunState& st, const TranscodeCommand& command) {
    checkCancelled(st, command.label);
    TranscodeResult result = m_transcoder.run(command);
    checkCancelled(st, command.label);
    return result;
}

void CompositionPipeline::report(RunState& st, core::JobStatus status, double progress,
                                 const std::string& stage, int segmentIndex) {
    if (core::isTerminal(st.job.status)) return;
    st.job.status = status;
    st.job.progress = std::max(st.job.progress, progress);
    st.job.currentStage = stage;
    if (segmentIndex > 0) st.job.segmentIndex = segmentIndex;
    if (st.observer) {
        st.observer({st.job.status, st.job.progress, st.job.currentStage,
                     st.job.segmentIndex, st.job.totalSegments, std::nullopt});
    }
}

void CompositionPipeline::warn(RunState& st, const std::string& message) {
    std::cerr << "[Compose] Warning: " << message << std::endl;
    st.job.warnings.push_back(message);
}

void CompositionPipeline::checkCancelled(RunState& st, const std::string& stage) {
    if (st.cancelled.load()) {
        throw core::CancelledError(stage);
    }
}

double CompositionPipeline::clipLength(const std::string& path) {
    return FilterGraph::reconcileDuration(m_transcoder.probeStreams(path));
}

std::string CompositionPipeline::dateText() const {
    if (!m_dateText.empty()) return m_dateText;
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, "%B %d, %Y");
    return ss.str();
}

} // namespace vmx::compose
