/**
 * @file phase_machine.cpp
 * @brief Phase state machine implementation.
 * @author Watosn
 */

#include "edlsim/phase/phase_machine.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace edlsim::phase {

namespace {

bool thresholds_met(const PhaseDefinition& phase, const VehicleState& state) {
  if (phase.entry_time_s && !(state.time_s >= *phase.entry_time_s)) {
    return false;
  }
  if (phase.entry_altitude_m && !(state.altitude_m <= *phase.entry_altitude_m)) {
    return false;
  }
  return true;
}

bool holds(const NamedCondition& c, const VehicleState& state) { return c.predicate && c.predicate(state); }

}  // namespace

std::string_view to_string(const MissionStatus status) {
  switch (status) {
    case MissionStatus::Active:
      return "active";
    case MissionStatus::Success:
      return "success";
    case MissionStatus::Failure:
      return "failure";
  }
  return "unknown";
}

PhaseMachine::PhaseMachine(MissionProfile profile) : profile_(std::move(profile)) {
  if (profile_.phases.empty()) {
    profile_.phases.push_back(PhaseDefinition{.name = "Mission"});
  }
  reset();
}

std::size_t PhaseMachine::classify(const VehicleState& state) const {
  for (std::size_t i = profile_.phases.size(); i-- > 0;) {
    if (thresholds_met(profile_.phases[i], state)) {
      return i;
    }
  }
  return 0;
}

TransitionCheck PhaseMachine::validate_transition(const std::size_t from, const std::size_t to, const VehicleState& state) const {
  if (from >= profile_.phases.size() || to >= profile_.phases.size()) {
    return TransitionCheck{.valid = false, .reason = fmt::format("phase index out of range ({} -> {})", from, to)};
  }
  const auto& src = profile_.phases[from];
  const auto& dst = profile_.phases[to];
  for (const auto& c : src.end_conditions) {
    if (!holds(c, state)) {
      return TransitionCheck{
          .valid = false,
          .reason = fmt::format("{} -> {}: end condition '{}' not met at t={:.2f}s", src.name, dst.name, c.name, state.time_s)};
    }
  }
  for (const auto& c : dst.start_conditions) {
    if (!holds(c, state)) {
      return TransitionCheck{
          .valid = false,
          .reason = fmt::format("{} -> {}: start condition '{}' not met at t={:.2f}s", src.name, dst.name, c.name, state.time_s)};
    }
  }
  return TransitionCheck{};
}

void PhaseMachine::evaluate_phase(const VehicleState& state, PhaseUpdate& out) {
  const auto& phase = profile_.phases[state_.phase_index];
  for (const auto& e : phase.events) {
    if (state_.fired_events.contains(e.name) || !holds(e, state)) {
      continue;
    }
    state_.fired_events.insert(e.name);
    out.newly_fired_events.push_back(e.name);
  }

  if (state_.status == MissionStatus::Active) {
    for (const auto& c : phase.critical_failures) {
      if (holds(c, state)) {
        state_.status = MissionStatus::Failure;
        state_.failure_reason = fmt::format("{} during {} at t={:.2f}s", c.name, phase.name, state.time_s);
        out.status_changed = true;
        break;
      }
    }
  }
  if (state_.status == MissionStatus::Active && state_.phase_index + 1 == profile_.phases.size() &&
      holds(profile_.success_condition, state)) {
    state_.status = MissionStatus::Success;
    out.status_changed = true;
  }

  out.new_phase = state_.phase_index;
  out.mission_status = state_.status;
  out.failure_reason = state_.failure_reason;
}

PhaseUpdate PhaseMachine::update(const VehicleState& state) {
  PhaseUpdate out{.previous_phase = state_.phase_index};
  const std::size_t target = classify(state);
  if (target > state_.phase_index) {
    out.transition = validate_transition(state_.phase_index, target, state);
    out.phase_changed = true;
    state_.phase_index = target;
    state_.phase_entry_time_s = state.time_s;
    state_.fired_events.clear();
  }
  evaluate_phase(state, out);
  return out;
}

PhaseUpdate PhaseMachine::seek(const VehicleState& state) {
  PhaseUpdate out{.previous_phase = state_.phase_index};
  const MissionStatus before = state_.status;
  reset();
  state_.phase_index = classify(state);
  state_.phase_entry_time_s = profile_.phases[state_.phase_index].entry_time_s.value_or(state.time_s);
  out.phase_changed = state_.phase_index != out.previous_phase;
  evaluate_phase(state, out);
  out.status_changed = state_.status != before;
  return out;
}

void PhaseMachine::reset() { state_ = PhaseState{}; }

double PhaseMachine::progress(const double time_s) const {
  const auto& phase = current_phase();
  const double start = phase.entry_time_s.value_or(state_.phase_entry_time_s);
  std::optional<double> end{};
  if (state_.phase_index + 1 < profile_.phases.size()) {
    end = profile_.phases[state_.phase_index + 1].entry_time_s;
  } else {
    end = profile_.end_time_s;
  }
  if (!end || !(*end > start)) {
    return 0.0;
  }
  return std::clamp((time_s - start) / (*end - start), 0.0, 1.0);
}

}  // namespace edlsim::phase
