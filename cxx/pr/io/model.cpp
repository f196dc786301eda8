#include "model.hpp"

#include "../log/log.hpp"

namespace pr {
namespace HD5 {

void WriteModel(Writer &writer, Reducer const &reducer)
{
  writer.writeVector(Keys::Mean, reducer.mean(), Dims::Mean);
  writer.writeMatrix(Keys::Basis, reducer.basis(), Dims::Basis);
  writer.writeVector(Keys::Eigenvalues, reducer.eigenvalues().matrix(), Dims::Eigenvalues);
  writer.writeIndex(Keys::Samples, reducer.samples());
  // Meta-data is for inspection with the h5 command, ReadModel only needs the number of components
  writer.writeMeta({{"components", static_cast<float>(reducer.components())},
                    {"features", static_cast<float>(reducer.features())},
                    {"explained", reducer.hasVariance() ? static_cast<float>(reducer.explainedVariance()) : 0.f}});
  Log::Print("HD5", "Wrote model with {} of {} components", reducer.components(), reducer.features());
}

auto ReadModel(Reader const &reader, Index const components) -> Reducer
{
  for (auto const &key : {Keys::Mean, Keys::Basis, Keys::Eigenvalues, Keys::Samples}) {
    if (!reader.exists(key)) { throw Log::Failure("HD5", "Model file is missing dataset '{}'", key); }
  }
  Index p = components;
  if (p == 0) {
    auto const meta = reader.readMeta();
    if (!meta.contains("components")) { throw Log::Failure("HD5", "Model file does not record a number of components"); }
    p = static_cast<Index>(meta.at("components"));
  }
  Reducer reducer(p);
  reducer.restore(reader.readVector(Keys::Mean), reader.readMatrix(Keys::Basis), reader.readVector(Keys::Eigenvalues).array(),
                  reader.readIndex(Keys::Samples));
  return reducer;
}

} // namespace HD5
} // namespace pr
