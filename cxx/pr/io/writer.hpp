#pragma once

#include "hd5-core.hpp"

#include <Eigen/Core>
#include <map>
#include <string>

namespace pr {
namespace HD5 {

void SetDeflate(Index const d); // 0 disables compression

struct Writer
{
  Writer(Writer const &) = delete;
  Writer(std::string const &fname, bool const append = false); // The extension is replaced with .h5
  ~Writer();

  // Rows and columns keep their meaning on disk, names are given in on-disk order
  void writeMatrix(std::string const &label, Eigen::Ref<Eigen::MatrixXd const> const &m, DNames<2> const &dims);
  void writeVector(std::string const &label, Eigen::Ref<Eigen::VectorXd const> const &v, DNames<1> const &dims);
  void writeIndex(std::string const &label, Index const value);
  void writeStrings(std::string const &label, std::vector<std::string> const &strings);
  void writeMeta(std::map<std::string, float> const &meta);

  auto exists(std::string const &name) const -> bool;

private:
  void write(std::string const &label, std::vector<Index> const &shape, double const *data, std::vector<std::string> const &dims);

  Handle handle_;
};

} // namespace HD5
} // namespace pr
