#include "Errors.hpp"


const char* stage_name(const Stage stage)
{
  switch (stage) {
  case Stage::data:
    return "data";
  case Stage::config:
    return "config";
  case Stage::simulator:
    return "simulator";
  case Stage::contraction:
    return "contraction mapping";
  case Stage::linear_solve:
    return "linear solve";
  case Stage::sequencing:
    return "sequencing";
  }
  return "unknown";
}
