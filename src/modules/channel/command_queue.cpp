// modules/channel/command_queue.cpp
#include "modules/channel/command_queue.h"
#include "common/utils/logger.h"
#include "core/types/errors.h"
#include <algorithm>

namespace agentflow {

void CommandQueue::enqueue(Command command) {
    if (auto problem = validate_command(command)) {
        rejected_++;
        Logger::warning("command_queue", "Rejected " + to_string(command_type(command)) + ": " + *problem);
        throw InvalidCommandError("Invalid command " + to_string(command_type(command)) + ": " + *problem);
    }
    Logger::debug("command_queue", "Enqueued " + to_string(command_type(command)));
    queue_.enqueue(std::move(command));
    total_++;
}

Command CommandQueue::enqueue_json(const Value& json) {
    Command command;
    try {
        command = command_from_json(json);
    } catch (const InvalidCommandError&) {
        rejected_++;
        Logger::warning("command_queue", "Rejected command: " + json.dump());
        throw;
    }
    enqueue(command);
    return command;
}

std::vector<Command> CommandQueue::process_commands() {
    auto commands = queue_.drain_sync();
    processed_ += commands.size();
    return commands;
}

std::vector<Command> CommandQueue::process_commands_async() {
    std::vector<Command> commands;
    while (auto command = queue_.try_dequeue()) {
        commands.push_back(std::move(*command));
    }
    processed_ += commands.size();
    return commands;
}

std::vector<Command> CommandQueue::process_commands_by_type(const std::vector<CommandType>& types) {
    auto matched = queue_.take_if([&types](const Command& command) {
        return std::find(types.begin(), types.end(), command_type(command)) != types.end();
    });
    processed_ += matched.size();
    return matched;
}

std::optional<Command> CommandQueue::wait_for_command(std::chrono::milliseconds timeout) {
    auto command = queue_.dequeue_for(timeout);
    if (command) {
        processed_++;
    }
    return command;
}

CommandQueueStats CommandQueue::stats() const {
    return CommandQueueStats{total_.load(), processed_.load(), rejected_.load()};
}

} // namespace agentflow
