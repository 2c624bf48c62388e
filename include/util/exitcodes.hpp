#pragma once

namespace exitc
{
constexpr int ok              = 0;
constexpr int bad_args        = 2;
constexpr int io_error        = 3;
constexpr int transfer_failed = 4;
}  // namespace exitc
