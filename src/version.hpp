#pragma once

namespace tkd
{
    constexpr int MAJOR_VERSION = 0;
    constexpr int MINOR_VERSION = 3;
    constexpr int PATCH_VERSION = 1;
}
