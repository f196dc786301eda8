#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pr {
namespace HD5 {

using Handle = int64_t;
using Index = long int;

void                     Init();
auto                     Exists(Handle const h, std::string const &name) -> bool;
void                     CheckedCall(int status, std::string const &msg);
std::string              GetError();
std::vector<std::string> List(Handle h); // Datasets directly below h

// An open dataset and its dataspace, closed on destruction
struct Dataset
{
  Dataset(Handle const parent, std::string const &name);
  Dataset(Dataset const &) = delete;
  ~Dataset();

  auto shape() const -> std::vector<Index>; // On-disk (C) order
  auto labels() const -> std::vector<std::string>;

  std::string name;
  Handle      id, space;
};

namespace Keys {
std::string const Basis = "basis";
std::string const Data = "data";
std::string const Eigenvalues = "eigenvalues";
std::string const Log = "log";
std::string const Mean = "mean";
std::string const Meta = "meta";
std::string const Reconstruction = "reconstruction";
std::string const Reduced = "reduced";
std::string const Samples = "samples";
} // namespace Keys

template <size_t N> struct DNames : std::array<std::string, N>
{
};

// Dimension names are given in on-disk (C) order
namespace Dims {
DNames<2> const Observations = {"sample", "feature"};
DNames<2> const Reduced = {"sample", "component"};
DNames<2> const Basis = {"feature", "component"};
DNames<1> const Mean = {"feature"};
DNames<1> const Eigenvalues = {"component"};
} // namespace Dims

} // namespace HD5
} // namespace pr
