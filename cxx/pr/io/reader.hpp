#pragma once

#include "hd5-core.hpp"

#include <Eigen/Core>
#include <map>
#include <string>

namespace pr {
namespace HD5 {

/*
 * Read-only access to an HDF5 file of observations or a model. Shapes and dimension names are reported in on-disk
 * (C) order, and matrices come back with the same row/column meaning they have on disk.
 */
struct Reader
{
  Reader(Reader const &) = delete;
  Reader(std::string const &fname);
  ~Reader();

  auto list() const -> std::vector<std::string>;
  auto exists(std::string const &label = Keys::Data) const -> bool;
  auto dimensions(std::string const &label = Keys::Data) const -> std::vector<Index>;
  auto listNames(std::string const &label = Keys::Data) const -> std::vector<std::string>;

  auto readMatrix(std::string const &label = Keys::Data) const -> Eigen::MatrixXd; // 1-D datasets become one column
  auto readVector(std::string const &label) const -> Eigen::VectorXd;
  auto readIndex(std::string const &label) const -> Index;
  auto readStrings(std::string const &label) const -> std::vector<std::string>;
  auto readMeta() const -> std::map<std::string, float>;

private:
  Handle handle_;
};

} // namespace HD5
} // namespace pr
