#include "ojudge/common/utils.hpp"

namespace ojudge {
using namespace std;

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

}  // namespace ojudge
