#pragma once

#include "../pca.hpp"
#include "reader.hpp"
#include "writer.hpp"

namespace pr {
namespace HD5 {

// Writes the mean, full basis, eigenvalues and a meta group describing a fitted Reducer
void WriteModel(Writer &writer, Reducer const &reducer);

// Reads a model back. If components is 0 the count stored in the file is used.
auto ReadModel(Reader const &reader, Index const components = 0) -> Reducer;

} // namespace HD5
} // namespace pr
