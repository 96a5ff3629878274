// modules/channel/command_queue.h
#ifndef AGENTFLOW_MODULES_CHANNEL_COMMAND_QUEUE_H
#define AGENTFLOW_MODULES_CHANNEL_COMMAND_QUEUE_H

#include "modules/channel/async_queue.h"
#include "modules/channel/command.h"
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>

namespace agentflow {

struct CommandQueueStats {
    size_t total_commands = 0;
    size_t processed_commands = 0;
    size_t rejected_commands = 0;
};

// Control-message mailbox for a running workflow. One consumer (the scheduler), many producers.
class CommandQueue {
public:
    CommandQueue() = default;

    // Throws InvalidCommandError (counted as rejected)
    void enqueue(Command command);
    Command enqueue_json(const Value& json);

    // Non-blocking: everything queued at call time
    std::vector<Command> process_commands();
    // Drains until the queue is observed empty
    std::vector<Command> process_commands_async();
    // Takes only the listed types; the rest go back in their original relative order
    std::vector<Command> process_commands_by_type(const std::vector<CommandType>& types);

    // Waits for the next command without polling; nullopt on timeout
    std::optional<Command> wait_for_command(std::chrono::milliseconds timeout);

    bool has_pending() const { return !queue_.empty(); }
    size_t size() const { return queue_.size(); }
    void clear() { queue_.clear(); }

    CommandQueueStats stats() const;

private:
    AsyncQueue<Command> queue_;
    std::atomic<size_t> total_{0};
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> rejected_{0};
};

} // namespace agentflow

#endif // AGENTFLOW_MODULES_CHANNEL_COMMAND_QUEUE_H
