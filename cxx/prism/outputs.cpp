#include "outputs.hpp"

#include "pr/log/log.hpp"

using namespace pr;

void WriteLog(HD5::Writer &writer)
{
  if (Log::Saved().size()) { writer.writeStrings(HD5::Keys::Log, Log::Saved()); }
}

void WriteOutput(
  std::string const &cmd, std::string const &fname, std::string const &key, Matrix const &data, HD5::DNames<2> const &dims)
{
  HD5::Writer writer(fname);
  writer.writeMatrix(key, data, dims);
  WriteLog(writer);
  Log::Print(cmd, "Wrote output file {}", fname);
}
