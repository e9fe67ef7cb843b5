#include "args.hpp"

#include "pn/io/hd5.hpp"
#include "pn/log/log.hpp"

using namespace pn;

void main_log(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "HD5 file to print the log from");
  args::ValueFlag<std::string>  category(parser, "C", "Only print entries from this category", {"category", 'c'});

  ParseCommand(parser);
  if (!iname) { throw args::Error("No input file specified"); }
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());
  if (!reader.exists(HD5::Keys::Log)) { throw Log::Failure(cmd, "{} does not contain a log", iname.Get()); }
  // Entries are "[HH:MM:SS] [category] message"
  auto const tag = category ? fmt::format("] [{:<6}]", category.Get()) : std::string();
  for (auto const &entry : reader.readStrings(HD5::Keys::Log)) {
    if (tag.empty() || entry.find(tag) != std::string::npos) { fmt::print("{}\n", entry); }
  }
}
