#pragma once

#include <memory>
#include <cstdint>

namespace kind {

//! A uniform random bit generator; usable wherever Boost.Random or the
//! standard library expect one.
class random_state {
public:
    using result_type = uint32_t;

    virtual ~random_state();

    static result_type min() noexcept;
    static result_type max() noexcept;
    virtual result_type generate() noexcept = 0;

    result_type operator()() noexcept {
        return generate();
    }
};

//! Deterministic: every state made this way yields the same sequence.
std::unique_ptr<random_state> make_random_state();
std::unique_ptr<random_state> make_random_state(uint64_t seed);

} //namespace kind
