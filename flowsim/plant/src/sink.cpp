#include <flowsim/plant/sink.hpp>

#include <utility>

namespace flowsim::plant {

Sink::Sink(Simulation& simulation, DeviceId id, std::string name, bool collect_parts,
           core::Duration cycle_time)
    : PartHandler(simulation, id, std::move(name), cycle_time)
    , collect_parts_(collect_parts) {}

void Sink::on_received_part(Part& part) {
    received_value_ += part.value();
    add_value("collected_part", part.value());
    part.mark_collected();
}

void Sink::dispatch_output() {
    record("collected_part", [&](core::TraceWriter& w) {
        w.field("part_id", output_->id());
        w.field("part_value", output_->value());
        w.field("quality", output_->quality());
    });
    if (collect_parts_) {
        collected_.push_back(std::move(output_));
    }
    output_.reset();
    notify_upstream_of_available_space();
}

} // namespace flowsim::plant
