#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace sharebox::server
{

    class ChunkBudget;

    // One in-flight chunk. Returns its slot to the budget when destroyed.
    class ChunkSlot
    {
    public:
        ChunkSlot(ChunkSlot &&other) noexcept;
        ChunkSlot &operator=(ChunkSlot &&other) noexcept;
        ~ChunkSlot();

        ChunkSlot(const ChunkSlot &) = delete;
        ChunkSlot &operator=(const ChunkSlot &) = delete;

    private:
        friend class ChunkBudget;
        explicit ChunkSlot(ChunkBudget *budget) noexcept : budget_(budget) {}

        ChunkBudget *budget_;
    };

    // Server wide cap on transfer chunks that are being read, forwarded or
    // written at the same time. Shared by every session.
    class ChunkBudget
    {
    public:
        explicit ChunkBudget(std::size_t limit);

        std::optional<ChunkSlot> try_acquire();

        std::size_t in_flight() const noexcept { return in_flight_.load(); }
        std::size_t limit() const noexcept { return limit_; }

    private:
        friend class ChunkSlot;
        void release() noexcept;

        std::size_t limit_;
        std::atomic<std::size_t> in_flight_{0};
    };

} // namespace sharebox::server
