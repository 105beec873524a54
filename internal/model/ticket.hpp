#pragma once

#include <map>
#include <optional>
#include <string>

namespace geocache::model {

/*
  Normalized locate ticket handed to every stage.

  `intersection` is the cross-reference road. Columns the loader does not
  recognize travel in `extra`.
*/
struct TicketInput {
  std::string ticket_key;
  std::string county;
  std::string city;
  std::string street;
  std::string intersection;

  std::optional<std::string> ticket_type;
  std::optional<std::string> duration;
  std::optional<std::string> work_type;
  std::optional<std::string> excavator;

  std::map<std::string, std::string> extra;
};

} // namespace geocache::model
