#include "command_buffer.hpp"

namespace modbridge::bridge {

std::string EntityRef::describe() const {
    if (is_provisional()) {
        return "provisional#" + std::to_string(value);
    }
    return "entity " + std::to_string(value);
}

const char* command_type_name(CommandType type) {
    switch (type) {
        case CommandType::Spawn: return "spawn";
        case CommandType::Despawn: return "despawn";
        case CommandType::Insert: return "insert";
        case CommandType::Remove: return "remove";
    }
    return "unknown";
}

EntityRef CommandBuffer::spawn(std::vector<world::ComponentValue> components) {
    Command cmd;
    cmd.type = CommandType::Spawn;
    cmd.target = EntityRef::provisional(spawnCount_);
    cmd.components = std::move(components);
    commands_.push_back(std::move(cmd));
    return EntityRef::provisional(spawnCount_++);
}

void CommandBuffer::despawn(EntityRef target) {
    Command cmd;
    cmd.type = CommandType::Despawn;
    cmd.target = target;
    commands_.push_back(std::move(cmd));
}

void CommandBuffer::insert(EntityRef target, ComponentId component, Bytes payload) {
    Command cmd;
    cmd.type = CommandType::Insert;
    cmd.target = target;
    cmd.component = std::move(component);
    cmd.payload = std::move(payload);
    commands_.push_back(std::move(cmd));
}

void CommandBuffer::remove(EntityRef target, ComponentId component) {
    Command cmd;
    cmd.type = CommandType::Remove;
    cmd.target = target;
    cmd.component = std::move(component);
    commands_.push_back(std::move(cmd));
}

void CommandBuffer::clear() {
    commands_.clear();
    spawnCount_ = 0;
}

} // namespace modbridge::bridge
