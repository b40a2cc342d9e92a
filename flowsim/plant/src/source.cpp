#include <flowsim/plant/source.hpp>
#include <flowsim/plant/simulation.hpp>

#include <flowsim/core/error.hpp>

#include <utility>

namespace flowsim::plant {

Source::Source(Simulation& simulation, DeviceId id, std::string name, PartPtr part_template,
               core::Duration cycle_time, std::optional<uint64_t> max_parts)
    : PartHandler(simulation, id, std::move(name), cycle_time)
    , template_(std::move(part_template))
    , remaining_(max_parts) {
    if (!template_) {
        throw core::InvalidStateError("Source '" + this->name() + "' needs a template part");
    }
}

void Source::set_remaining_parts(std::optional<uint64_t> remaining) {
    remaining_ = remaining;
    record("budget_changed", [&](core::TraceWriter& w) {
        if (remaining_) {
            w.field("remaining", *remaining_);
        }
    });
    if (is_initialized()) {
        start_next_cycle();
    }
}

void Source::on_initialize() {
    start_next_cycle();
}

void Source::on_cycle_finished(Part& part) {
    pending_cost_ = part.value();
}

void Source::on_part_passed() {
    supplied_cost_ += pending_cost_;
    add_cost("supplied_part", pending_cost_);
    pending_cost_ = 0.0;
    start_next_cycle();
}

void Source::on_restore() {
    if (input_ || output_) {
        PartHandler::on_restore();
        return;
    }
    start_next_cycle();
}

void Source::start_next_cycle() {
    if (!is_operational() || input_ || output_) {
        return;
    }
    if (remaining_) {
        if (*remaining_ == 0) {
            return;
        }
        --*remaining_;
    }

    input_ = template_->make_copy();
    input_->assign_id(simulation().next_part_id());
    input_->add_routing_history(id());
    record("created_part", [&](core::TraceWriter& w) {
        w.field("part_id", input_->id());
        w.field("part", std::string_view{input_->name()});
    });
    try_start_cycle();
}

} // namespace flowsim::plant
