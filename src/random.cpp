#include "random.hpp"

#include <boost/predef/other/endian.h>

#if defined (BOOST_ENDIAN_LITTLE_BYTE_AVAILABLE)
#   define PCG_LITTLE_ENDIAN 1
#endif

#include <pcg_random.hpp>

namespace kind {

random_state::~random_state() = default;
uint32_t random_state::min() noexcept { return pcg32::min(); }
uint32_t random_state::max() noexcept { return pcg32::max(); }

class random_state_impl final : public random_state {
public:
    random_state_impl() = default;

    explicit random_state_impl(uint64_t const seed)
      : state {seed}
    {
    }

    result_type generate() noexcept final override;

    pcg32 state {};
};

random_state::result_type random_state_impl::generate() noexcept {
    return state();
}

std::unique_ptr<random_state> make_random_state() {
    return std::make_unique<random_state_impl>();
}

std::unique_ptr<random_state> make_random_state(uint64_t const seed) {
    return std::make_unique<random_state_impl>(seed);
}

} //namespace kind
