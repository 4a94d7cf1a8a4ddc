#ifndef TIERLEND_TEST_JTX_TER_H_INCLUDED
#define TIERLEND_TEST_JTX_TER_H_INCLUDED

#include <test/jtx/JTx.h>

#include <tuple>

namespace tierlend {
namespace test {
namespace jtx {

class Env;

/** Set the expected result code for a JTx
    The test will fail if the code doesn't match.
*/
class ter
{
private:
    std::optional<TER> v_;

public:
    explicit ter(decltype(std::ignore)) : v_(std::nullopt)
    {
    }

    explicit ter(TER v) : v_(v)
    {
    }

    void
    operator()(Env&, JTx& jt) const
    {
        jt.ter = v_;
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace tierlend

#endif
