#ifndef expected_hpp
#define expected_hpp

#include <expected>

namespace xembly {

using std::unexpected;
using std::expected;

}

#endif /* expected_hpp */
