#include <iostream>
#include <cstdlib>
#include <string>

// Declarations of test functions
bool test_config_defaults_and_clamps();
bool test_transition_cue_caps();
bool test_json_contract_beat_grid();
bool test_json_contract_validate();
bool test_mix_types_json();
bool test_strategy_chain_fallback();
bool test_scoped_temp_dir_cleanup();
bool test_energy_on_silence();
bool test_energy_loud_section_scores_higher();
bool test_energy_curve_helpers();
bool test_tempo_fallback_on_short_signal();
bool test_segments_pick_separated_high_energy_windows();
bool test_segments_short_track_single_window();
bool test_segments_too_short_track_yields_none();
bool test_segments_respect_max_count();
bool test_highlight_energy_peak_without_popularity();
bool test_highlight_popularity_in_loud_passage_wins();
bool test_highlight_quiet_popularity_falls_back_to_energy();
bool test_highlight_aligns_to_beat_and_phrase_dip();
bool test_highlight_short_alignment_keeps_raw_window();
bool test_highlight_empty_curve_unavailable();
bool test_pipeline_dependency_order();
bool test_pipeline_detects_cycles_and_missing_dependencies();
bool test_pipeline_module_failure_names_stage();
bool test_pipeline_stub_results_carry_versions();
bool test_audio_buffer_zeroed_and_mixdown();
bool test_audio_loader_wav_roundtrip();
bool test_energy_analyzer_on_synthetic_track();
bool test_tempo_distance_half_double_time();
bool test_sequencer_tempo_smooth();
bool test_sequencer_descending_energy();
bool test_sequencer_language_variety_bounds_runs();
bool test_sequencer_language_variety_looks_ahead();
bool test_sequencer_language_variety_relaxes_when_impossible();
bool test_sequencer_is_deterministic();
bool test_sequencer_wave_alternates();
bool test_sequencer_edge_cases();
bool test_sequencer_quality_penalizes_language_runs();
bool test_sequencer_suggest_next();
bool test_transition_timing_is_clamped();
bool test_transition_filter_shares_audio_timing();
bool test_transition_palette_round_robin();
bool test_drawtext_escaping_and_numbers();
bool test_ducking_filter_windows();
bool test_segment_command_overlay();
bool test_concat_list_quotes_paths();
bool test_reconcile_and_probe_parsing();
bool test_commentary_cue_planning();
bool test_commentary_energy_cues_single_language();
bool test_process_helpers();
bool test_composition_happy_path();
bool test_composition_skips_failed_segment();
bool test_composition_fails_without_enough_segments();
bool test_composition_rejects_empty_plan();
bool test_composition_cancellation();
bool test_composition_cancel_during_transitions();
bool test_composition_tolerates_card_failure();
bool test_composition_transition_falls_back_to_concat();
bool test_composition_join_failure_is_fatal();
bool test_composition_plain_concat_trims_mismatched_clip();
bool test_composition_tolerates_commentary_failure();
bool test_registry_terminal_states_are_absorbing();
bool test_registry_concurrent_updates();
bool test_job_manager_runs_to_completion();
bool test_job_manager_cancels_running_job();
bool test_job_manager_concurrent_jobs();
bool test_source_cache_single_flight();
bool test_source_cache_locks_by_entry_name();
bool test_source_cache_miss_and_sidecar();
bool test_local_fetcher_reads_media_dir();

int main() {
    int failed = 0;
    int total = 0;

    const char* quietEnv = std::getenv("VMX_TEST_QUIET");
    bool quiet = quietEnv && std::string(quietEnv) != "0";

    if (!quiet) std::cout << "Running tests..." << std::endl;

    auto run_test = [&](const char* name, bool (*fn)()) {
        ++total;
        bool ok = fn();
        if (!quiet) {
            std::cout << "- " << name << ": " << (ok ? "PASS" : "FAIL") << std::endl;
        }
        if (!ok) ++failed;
    };

    run_test("test_config_defaults_and_clamps", &test_config_defaults_and_clamps);
    run_test("test_transition_cue_caps", &test_transition_cue_caps);
    run_test("test_json_contract_beat_grid", &test_json_contract_beat_grid);
    run_test("test_json_contract_validate", &test_json_contract_validate);
    run_test("test_mix_types_json", &test_mix_types_json);
    run_test("test_strategy_chain_fallback", &test_strategy_chain_fallback);
    run_test("test_scoped_temp_dir_cleanup", &test_scoped_temp_dir_cleanup);
    run_test("test_energy_on_silence", &test_energy_on_silence);
    run_test("test_energy_loud_section_scores_higher", &test_energy_loud_section_scores_higher);
    run_test("test_energy_curve_helpers", &test_energy_curve_helpers);
    run_test("test_tempo_fallback_on_short_signal", &test_tempo_fallback_on_short_signal);
    run_test("test_segments_pick_separated_high_energy_windows", &test_segments_pick_separated_high_energy_windows);
    run_test("test_segments_short_track_single_window", &test_segments_short_track_single_window);
    run_test("test_segments_too_short_track_yields_none", &test_segments_too_short_track_yields_none);
    run_test("test_segments_respect_max_count", &test_segments_respect_max_count);
    run_test("test_highlight_energy_peak_without_popularity", &test_highlight_energy_peak_without_popularity);
    run_test("test_highlight_popularity_in_loud_passage_wins", &test_highlight_popularity_in_loud_passage_wins);
    run_test("test_highlight_quiet_popularity_falls_back_to_energy", &test_highlight_quiet_popularity_falls_back_to_energy);
    run_test("test_highlight_aligns_to_beat_and_phrase_dip", &test_highlight_aligns_to_beat_and_phrase_dip);
    run_test("test_highlight_short_alignment_keeps_raw_window", &test_highlight_short_alignment_keeps_raw_window);
    run_test("test_highlight_empty_curve_unavailable", &test_highlight_empty_curve_unavailable);
    run_test("test_pipeline_dependency_order", &test_pipeline_dependency_order);
    run_test("test_pipeline_detects_cycles_and_missing_dependencies", &test_pipeline_detects_cycles_and_missing_dependencies);
    run_test("test_pipeline_module_failure_names_stage", &test_pipeline_module_failure_names_stage);
    run_test("test_pipeline_stub_results_carry_versions", &test_pipeline_stub_results_carry_versions);
    run_test("test_audio_buffer_zeroed_and_mixdown", &test_audio_buffer_zeroed_and_mixdown);
    run_test("test_audio_loader_wav_roundtrip", &test_audio_loader_wav_roundtrip);
    run_test("test_energy_analyzer_on_synthetic_track", &test_energy_analyzer_on_synthetic_track);
    run_test("test_tempo_distance_half_double_time", &test_tempo_distance_half_double_time);
    run_test("test_sequencer_tempo_smooth", &test_sequencer_tempo_smooth);
    run_test("test_sequencer_descending_energy", &test_sequencer_descending_energy);
    run_test("test_sequencer_language_variety_bounds_runs", &test_sequencer_language_variety_bounds_runs);
    run_test("test_sequencer_language_variety_looks_ahead", &test_sequencer_language_variety_looks_ahead);
    run_test("test_sequencer_language_variety_relaxes_when_impossible", &test_sequencer_language_variety_relaxes_when_impossible);
    run_test("test_sequencer_is_deterministic", &test_sequencer_is_deterministic);
    run_test("test_sequencer_wave_alternates", &test_sequencer_wave_alternates);
    run_test("test_sequencer_edge_cases", &test_sequencer_edge_cases);
    run_test("test_sequencer_quality_penalizes_language_runs", &test_sequencer_quality_penalizes_language_runs);
    run_test("test_sequencer_suggest_next", &test_sequencer_suggest_next);
    run_test("test_transition_timing_is_clamped", &test_transition_timing_is_clamped);
    run_test("test_transition_filter_shares_audio_timing", &test_transition_filter_shares_audio_timing);
    run_test("test_transition_palette_round_robin", &test_transition_palette_round_robin);
    run_test("test_drawtext_escaping_and_numbers", &test_drawtext_escaping_and_numbers);
    run_test("test_ducking_filter_windows", &test_ducking_filter_windows);
    run_test("test_segment_command_overlay", &test_segment_command_overlay);
    run_test("test_concat_list_quotes_paths", &test_concat_list_quotes_paths);
    run_test("test_reconcile_and_probe_parsing", &test_reconcile_and_probe_parsing);
    run_test("test_commentary_cue_planning", &test_commentary_cue_planning);
    run_test("test_commentary_energy_cues_single_language", &test_commentary_energy_cues_single_language);
    run_test("test_process_helpers", &test_process_helpers);
    run_test("test_composition_happy_path", &test_composition_happy_path);
    run_test("test_composition_skips_failed_segment", &test_composition_skips_failed_segment);
    run_test("test_composition_fails_without_enough_segments", &test_composition_fails_without_enough_segments);
    run_test("test_composition_rejects_empty_plan", &test_composition_rejects_empty_plan);
    run_test("test_composition_cancellation", &test_composition_cancellation);
    run_test("test_composition_cancel_during_transitions", &test_composition_cancel_during_transitions);
    run_test("test_composition_tolerates_card_failure", &test_composition_tolerates_card_failure);
    run_test("test_composition_transition_falls_back_to_concat", &test_composition_transition_falls_back_to_concat);
    run_test("test_composition_join_failure_is_fatal", &test_composition_join_failure_is_fatal);
    run_test("test_composition_plain_concat_trims_mismatched_clip", &test_composition_plain_concat_trims_mismatched_clip);
    run_test("test_composition_tolerates_commentary_failure", &test_composition_tolerates_commentary_failure);
    run_test("test_registry_terminal_states_are_absorbing", &test_registry_terminal_states_are_absorbing);
    run_test("test_registry_concurrent_updates", &test_registry_concurrent_updates);
    run_test("test_job_manager_runs_to_completion", &test_job_manager_runs_to_completion);
    run_test("test_job_manager_cancels_running_job", &test_job_manager_cancels_running_job);
    run_test("test_job_manager_concurrent_jobs", &test_job_manager_concurrent_jobs);
    run_test("test_source_cache_single_flight", &test_source_cache_single_flight);
    run_test("test_source_cache_locks_by_entry_name", &test_source_cache_locks_by_entry_name);
    run_test("test_source_cache_miss_and_sidecar", &test_source_cache_miss_and_sidecar);
    run_test("test_local_fetcher_reads_media_dir", &test_local_fetcher_reads_media_dir);

    int passed = total - failed;
    std::cout << "Summary: " << passed << "/" << total << " passed, " << failed << " failed" << std::endl;

    return failed == 0 ? 0 : 1;
}
