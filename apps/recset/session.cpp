#include "session.hpp"

#include "recset/exceptions.hpp"
#include "recset/logging.hpp"
#include "recset/map.hpp"
#include "recset/sequence.hpp"
#include "recset/set.hpp"
#include "recset/tuple.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <functional>
#include <map>


using args_type = rcs::stl::vector<rcs::value>;

struct command {
  size_t nargs;
  std::string_view usage;
  std::string_view description;
  std::function<void(std::ostream&, const args_type&)> run;
}; // struct command


static size_t
_size(rcs::value x)
{
  switch (x->t)
  {
    case rcs::tag::seq: return as_seq(x).size();
    case rcs::tag::tuple: return as_tuple(x).size();
    case rcs::tag::set: return as_set(x).size();
    case rcs::tag::map: return as_map(x).size();
    default:
      throw std::invalid_argument {
          std::format("size() - {} is not a container", tag_name(x->t))};
  }
}


static void
_print_bool(std::ostream &os, bool x)
{ os << (x ? "true" : "false") << std::endl; }


template <typename Op>
static std::function<void(std::ostream&, const args_type&)>
_set_algebra(Op op)
{
  return [op](std::ostream &os, const args_type &args) {
    const rcs::set result = op(as_set(args[0]), as_set(args[1]));
    os << std::format("{}", result) << std::endl;
  };
}


static const std::map<std::string, command, std::less<>>&
_commands()
{
  using namespace rcs;

  static const std::map<std::string, command, std::less<>> commands {
    {"show", {1, "show X", "print X in canonical form",
              [](std::ostream &os, const args_type &args) {
                os << std::format("{}", args[0]) << std::endl;
              }}},
    {"hash", {1, "hash X", "print the content hash of X (freezes it)",
              [](std::ostream &os, const args_type &args) {
                os << hash(args[0]) << std::endl;
              }}},
    {"size", {1, "size C", "print the number of elements of a container",
              [](std::ostream &os, const args_type &args) {
                os << _size(args[0]) << std::endl;
              }}},
    {"union", {2, "union A B", "union of two sets",
               _set_algebra([](const set &a, const set &b) {
                 return a.unite(b);
               })}},
    {"intersection", {2, "intersection A B", "intersection of two sets",
                      _set_algebra([](const set &a, const set &b) {
                        return a.intersection(b);
                      })}},
    {"difference", {2, "difference A B", "elements of A missing in B",
                    _set_algebra([](const set &a, const set &b) {
                      return a.difference(b);
                    })}},
    {"symdiff", {2, "symdiff A B", "symmetric difference of two sets",
                 _set_algebra([](const set &a, const set &b) {
                   return a.symmetric_difference(b);
                 })}},
    {"product", {2, "product A B", "cartesian product of two sets",
                 _set_algebra([](const set &a, const set &b) {
                   return a.cartesian_product(b);
                 })}},
    {"powerset", {1, "powerset A", "set of all subsets of A",
                  [](std::ostream &os, const args_type &args) {
                    os << std::format("{}", as_set(args[0]).powerset())
                       << std::endl;
                  }}},
    {"subset", {2, "subset A B", "check whether A is a subset of B",
                [](std::ostream &os, const args_type &args) {
                  _print_bool(os, as_set(args[0]).is_subset(as_set(args[1])));
                }}},
    {"superset", {2, "superset A B", "check whether A is a superset of B",
                  [](std::ostream &os, const args_type &args) {
                    _print_bool(os,
                                as_set(args[0]).is_superset(as_set(args[1])));
                  }}},
    {"equal", {2, "equal X Y", "structural equality",
               [](std::ostream &os, const args_type &args) {
                 _print_bool(os, equal(args[0], args[1]));
               }}},
    {"compare", {2, "compare X Y", "print -1, 0 or 1 by canonical order",
                 [](std::ostream &os, const args_type &args) {
                   const int c = compare(args[0], args[1]);
                   os << (c < 0 ? -1 : c > 0 ? 1 : 0) << std::endl;
                 }}},
    {"has", {2, "has C X", "membership in a set, or key lookup in a map",
             [](std::ostream &os, const args_type &args) {
               if (ismap(args[0]))
                 _print_bool(os, as_map(args[0]).has(args[1]));
               else
                 _print_bool(os, as_set(args[0]).has(args[1]));
             }}},
    {"get", {2, "get M K", "value bound to K in map M",
             [](std::ostream &os, const args_type &args) {
               os << std::format("{}", as_map(args[0]).at(args[1]))
                  << std::endl;
             }}},
  };
  return commands;
}


const std::vector<std::string>&
session::command_names()
{
  static const std::vector<std::string> names = [] {
    std::vector<std::string> ret {"help"};
    for (const auto &[name, _] : _commands())
      ret.push_back(name);
    return ret;
  }();
  return names;
}


session::session(std::ostream &out)
: m_out {out}
{ }


bool
session::feed(const std::string &line)
{
  if (not m_reader)
  {
    // Split off the command name
    const auto isspace = [&](size_t i) {
      return std::isspace(static_cast<unsigned char>(line[i]));
    };
    size_t begin = 0;
    while (begin < line.size() and isspace(begin))
      begin++;
    if (begin == line.size() or line[begin] == ';')
      return false;
    size_t end = begin;
    while (end < line.size() and not isspace(end))
      end++;

    m_command = line.substr(begin, end - begin);
    m_reader.emplace(m_parser);
    try { *m_reader << line.substr(end); }
    catch (const rcs::parse_error &exn)
    {
      rcs::error("{} (at offset {})", exn.what(), end + exn.offset());
      m_reader.reset();
      return false;
    }
  }
  else
  {
    try { *m_reader << "\n" + line; }
    catch (const rcs::parse_error &exn)
    {
      rcs::error("{}", exn.what());
      m_reader.reset();
      return false;
    }
  }

  if (m_reader->pending())
    return true;

  args_type args;
  for (std::optional<rcs::value> x; *m_reader >> x;)
    args.push_back(*x);
  m_reader.reset();

  try { _run(m_command, args); }
  catch (const rcs::container_error &exn)
  { rcs::error("{}", exn.what()); }
  catch (const std::invalid_argument &exn)
  { rcs::error("{}", exn.what()); }
  catch (const std::out_of_range &exn)
  { rcs::error("{}", exn.what()); }
  return false;
}


bool
session::discard()
{
  if (not m_reader)
    return false;
  m_reader.reset();
  return true;
}


void
session::_run(const std::string &name, const args_type &args)
{
  if (name == "help")
  {
    m_out << "Commands:" << std::endl;
    for (const auto &[_, cmd] : _commands())
      m_out << std::format("  {:24} {}", cmd.usage, cmd.description)
            << std::endl;
    m_out << std::format("  {:24} {}", "help", "print this message")
          << std::endl;
    return;
  }

  const auto it = _commands().find(name);
  if (it == _commands().end())
  {
    rcs::error("unknown command '{}' (try 'help')", name);
    return;
  }

  const command &cmd = it->second;
  if (args.size() != cmd.nargs)
  {
    rcs::error("{}: expected {} argument(s), got {} (usage: {})", name,
               cmd.nargs, args.size(), cmd.usage);
    return;
  }

  rcs::debug("running {} with {} argument(s)", name, args.size());
  cmd.run(m_out, args);
}
