#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace sharebox::server
{

    // Issues transfer identifiers of the form "t<sequence>-<random hex>".
    // The sequence never repeats for the lifetime of the generator.
    class TransferIdGenerator
    {
    public:
        std::string next();

        std::uint64_t issued() const noexcept { return counter_.load(); }

    private:
        std::atomic<std::uint64_t> counter_{0};
    };

} // namespace sharebox::server
