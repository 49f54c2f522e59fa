#pragma once

#include <stdexcept>
#include <string>

namespace clmash {

// Inputs that violate a render precondition. Retrying with the same data
// cannot succeed, so these abort the job.
class invalid_input : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// A beat sequence with fewer than two entries: no interval to align.
class insufficient_beats : public invalid_input {
public:
  using invalid_input::invalid_input;
};

}
