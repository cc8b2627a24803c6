#ifndef HTTPREC_RECORDER_REPOSITORY_NULL_REPOSITORY_HPP_
#define HTTPREC_RECORDER_REPOSITORY_NULL_REPOSITORY_HPP_

#include "repository/interaction_repository.hpp"
#include "exception/recorder_exception.hpp"

namespace httprec::recorder
{
  // Used when recording is disabled: nothing exists, nothing is stored.
  class NullRepository : public InteractionRepository
  {
  public:
    bool exists(const std::string&) override
    {
      return false;
    }

    Interaction load(const std::string& interaction_name) override
    {
      throw NoSuchInteraction(interaction_name);
    }

    std::optional<Interaction> store(const Interaction&) override
    {
      return std::nullopt;
    }
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_NULL_REPOSITORY_HPP_
