#ifndef HTTPREC_RECORDER_REPOSITORY_INTERACTION_REPOSITORY_HPP_
#define HTTPREC_RECORDER_REPOSITORY_INTERACTION_REPOSITORY_HPP_

#include "model/interaction.hpp"
#include <optional>
#include <string>

namespace httprec::recorder
{
  /**
   * @brief Persistence boundary for interactions.
   *
   * Variants carry no shared state; pick one when building the recorder
   * configuration.
   */
  class InteractionRepository
  {
  public:
    virtual ~InteractionRepository() = default;

    virtual bool exists(const std::string& interaction_name) = 0;

    /**
     * @throws NoSuchInteraction, MalformedArchive, PersistenceIOFailure or UnsupportedOperation.
     */
    virtual Interaction load(const std::string& interaction_name) = 0;

    /**
     * @brief Persists the messages of the interaction.
     * @return The interaction as persisted, or std::nullopt when nothing was stored
     *         (disabled sink, empty interaction). Callers must not store it again.
     * @throws PersistenceIOFailure or MalformedArchive when an existing archive cannot be extended.
     */
    virtual std::optional<Interaction> store(const Interaction& interaction) = 0;
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_INTERACTION_REPOSITORY_HPP_
