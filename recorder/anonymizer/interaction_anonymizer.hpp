#ifndef HTTPREC_RECORDER_ANONYMIZER_INTERACTION_ANONYMIZER_HPP_
#define HTTPREC_RECORDER_ANONYMIZER_INTERACTION_ANONYMIZER_HPP_

#include "model/interaction.hpp"

namespace httprec::recorder
{
  class InteractionAnonymizer
  {
  public:
    virtual ~InteractionAnonymizer() = default;

    /**
     * @brief Redacts sensitive data before the interaction is persisted.
     *
     * Implementations must be idempotent and must not throw on absent or
     * malformed bodies.
     */
    virtual Interaction anonymize(Interaction interaction) const = 0;
  };

  class NullAnonymizer : public InteractionAnonymizer
  {
  public:
    Interaction anonymize(Interaction interaction) const override
    {
      return interaction;
    }
  };
}

#endif // HTTPREC_RECORDER_ANONYMIZER_INTERACTION_ANONYMIZER_HPP_
