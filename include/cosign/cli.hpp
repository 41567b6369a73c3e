#pragma once

#include "types.hpp"

namespace cosign::cli
{
    /** Process exit status for a failed operation: 2 for ledger rejections, 3 for TransferFailed, 1 otherwise */
    int exit_code(const CosignError &error);

    int run(int argc, char *argv[]);
}
