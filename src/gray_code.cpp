#include "mpam/gray_code.hpp"
#include "mpam/errors.hpp"

namespace mpam {

int gray_encode(int index)
{
    if (index < 0) throw InvalidArgument("gray_encode: negative index");
    return index ^ (index >> 1);
}

int gray_decode(int gray)
{
    if (gray < 0) throw InvalidArgument("gray_decode: negative label");
    int n = gray;
    for (int shift = gray >> 1; shift != 0; shift >>= 1)
        n ^= shift;
    return n;
}

} // namespace mpam
