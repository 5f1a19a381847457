#include "lifemesh/rules.hpp"

namespace lifemesh {

bool rule(bool alive, unsigned count) {
    if (alive) return count == 2 || count == 3;
    return count == 3;
}

}
