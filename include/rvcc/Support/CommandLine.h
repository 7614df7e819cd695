#pragma once

//
// This file is distributed under the MIT License. See LICENSE.md for details.
//

#include "llvm/Support/CommandLine.h"

/// The category all the rvcc options are registered in
extern llvm::cl::OptionCategory MainCategory;
