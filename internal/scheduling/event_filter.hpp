#pragma once

#include <google/protobuf/struct.pb.h>

namespace fleet::scheduling {

/*
  Event filter matching.

  Every key of `filter` must be present in `data`. A plain value matches
  by equality; an object whose keys start with '$' is an operator set:

    $eq, $ne     equality / inequality
    $gt, $lt     numeric or string ordering
    $in          membership in a list
    $regex       ECMAScript regex anchored at the start of the value
*/
bool MatchesEventFilter(const google::protobuf::Struct& data, const google::protobuf::Struct& filter);

} // namespace fleet::scheduling
