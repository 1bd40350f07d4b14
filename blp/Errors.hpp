#ifndef ERRORSHEADERDEF
#define ERRORSHEADERDEF

#include <stdexcept>
#include <string>


// stage of the estimation pipeline where a fatal error was raised
enum class Stage
{
  data,
  config,
  simulator,
  contraction,
  linear_solve,
  sequencing
};

const char* stage_name(const Stage stage);

class BLPError : public std::runtime_error
{

public:
  BLPError(const Stage stage_, const std::string& what_)
    : std::runtime_error(what_), err_stage(stage_) {}
  Stage stage() const { return err_stage; }

private:
  Stage err_stage;
};

#endif
