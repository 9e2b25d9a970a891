#include "sharebox/server/chunk_budget.hpp"

#include <utility>

namespace sharebox::server
{

    ChunkSlot::ChunkSlot(ChunkSlot &&other) noexcept : budget_(std::exchange(other.budget_, nullptr)) {}

    ChunkSlot &ChunkSlot::operator=(ChunkSlot &&other) noexcept
    {
        if (this != &other)
        {
            if (budget_)
            {
                budget_->release();
            }
            budget_ = std::exchange(other.budget_, nullptr);
        }
        return *this;
    }

    ChunkSlot::~ChunkSlot()
    {
        if (budget_)
        {
            budget_->release();
        }
    }

    ChunkBudget::ChunkBudget(std::size_t limit) : limit_(limit) {}

    std::optional<ChunkSlot> ChunkBudget::try_acquire()
    {
        auto current = in_flight_.load();
        do
        {
            if (current >= limit_)
            {
                return std::nullopt;
            }
        } while (!in_flight_.compare_exchange_weak(current, current + 1));
        return ChunkSlot(this);
    }

    void ChunkBudget::release() noexcept
    {
        in_flight_.fetch_sub(1);
    }

} // namespace sharebox::server
