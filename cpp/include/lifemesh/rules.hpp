#pragma once

namespace lifemesh {

bool rule(bool alive, unsigned count);
}
