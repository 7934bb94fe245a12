/**
 * @file phase_machine.hpp
 * @brief Mission phase table, classification and polled state machine.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "edlsim/phase/vehicle_state.hpp"

namespace edlsim::phase {

using Predicate = std::function<bool(const VehicleState&)>;

/**
 * @brief Predicate with a human-readable name used in reasons and event lists.
 */
struct NamedCondition {
  std::string name{};
  Predicate predicate{};
};

/**
 * @brief Static description of one mission phase.
 *
 * The phase is entered once every threshold it defines is met: `time >= entry_time_s`
 * and `altitude <= entry_altitude_m`. A phase without thresholds is always satisfied.
 */
struct PhaseDefinition {
  std::string name{};
  std::string description{};
  std::optional<double> entry_time_s{};
  std::optional<double> entry_altitude_m{};
  std::vector<NamedCondition> start_conditions{};
  std::vector<NamedCondition> end_conditions{};
  std::vector<NamedCondition> events{};
  std::vector<NamedCondition> critical_failures{};
};

/**
 * @brief Ordered phase table plus the terminal success condition.
 *
 * `success_condition` is only evaluated while the final phase is active.
 */
struct MissionProfile {
  std::string name{};
  std::vector<PhaseDefinition> phases{};
  NamedCondition success_condition{};
  std::optional<double> end_time_s{};
};

enum class MissionStatus : std::uint8_t { Active, Success, Failure };

[[nodiscard]] std::string_view to_string(MissionStatus status);

struct PhaseState {
  std::size_t phase_index{};
  double phase_entry_time_s{};
  std::set<std::string> fired_events{};
  MissionStatus status{MissionStatus::Active};
  std::optional<std::string> failure_reason{};
};

struct TransitionCheck {
  bool valid{true};
  std::string reason{};
};

/**
 * @brief Result of one `update`/`seek` call.
 */
struct PhaseUpdate {
  bool phase_changed{false};
  std::size_t previous_phase{};
  std::size_t new_phase{};
  std::vector<std::string> newly_fired_events{};
  MissionStatus mission_status{MissionStatus::Active};
  bool status_changed{false};
  std::optional<std::string> failure_reason{};
  TransitionCheck transition{};
};

/**
 * @brief Polled phase state machine over a mission profile.
 *
 * `update` follows normal playback: the phase index never decreases and events fire at
 * most once per phase visit. Critical failures and the success condition set a terminal
 * status that later updates never clear. `seek` recomputes everything from scratch for
 * an arbitrary state.
 */
class PhaseMachine {
 public:
  /**
   * @brief Take ownership of a profile; an empty phase table becomes one unconditional phase.
   */
  explicit PhaseMachine(MissionProfile profile);

  /**
   * @brief Last phase whose entry thresholds are all satisfied, or 0 if none is.
   */
  [[nodiscard]] std::size_t classify(const VehicleState& state) const;

  /**
   * @brief Check end conditions of `from` and start conditions of `to` against `state`.
   *
   * Diagnostic only; classification proceeds regardless.
   */
  [[nodiscard]] TransitionCheck validate_transition(std::size_t from, std::size_t to, const VehicleState& state) const;

  [[nodiscard]] PhaseUpdate update(const VehicleState& state);
  [[nodiscard]] PhaseUpdate seek(const VehicleState& state);
  void reset();

  /**
   * @brief Fraction of the current phase elapsed at `time_s`, in [0, 1].
   */
  [[nodiscard]] double progress(double time_s) const;

  [[nodiscard]] const PhaseState& state() const noexcept { return state_; }
  [[nodiscard]] const MissionProfile& profile() const noexcept { return profile_; }
  [[nodiscard]] const PhaseDefinition& current_phase() const { return profile_.phases[state_.phase_index]; }

 private:
  void evaluate_phase(const VehicleState& state, PhaseUpdate& out);

  MissionProfile profile_{};
  PhaseState state_{};
};

}  // namespace edlsim::phase
