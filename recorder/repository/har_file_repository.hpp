#ifndef HTTPREC_RECORDER_REPOSITORY_HAR_FILE_REPOSITORY_HPP_
#define HTTPREC_RECORDER_REPOSITORY_HAR_FILE_REPOSITORY_HPP_

#include "repository/interaction_repository.hpp"
#include "anonymizer/rules_anonymizer.hpp"
#include <boost/filesystem/path.hpp>
#include <memory>

namespace httprec::recorder
{
  /**
   * @brief Stores one HAR file per interaction name.
   *
   * The file is <directory>/<sanitized name>, with ".har" appended when the name
   * has no extension. store() anonymizes before writing and appends to an
   * existing archive.
   */
  class HarFileRepository : public InteractionRepository
  {
  public:
    static constexpr const char* kFileExtension = ".har";

    explicit HarFileRepository(boost::filesystem::path directory = boost::filesystem::path("."),
                               std::shared_ptr<InteractionAnonymizer> anonymizer = RulesAnonymizer::defaults());

    bool exists(const std::string& interaction_name) override;
    Interaction load(const std::string& interaction_name) override;
    std::optional<Interaction> store(const Interaction& interaction) override;

    boost::filesystem::path archive_path(const std::string& interaction_name) const;

  private:
    boost::filesystem::path directory_;
    std::shared_ptr<InteractionAnonymizer> anonymizer_;
  };
}

#endif // HTTPREC_RECORDER_REPOSITORY_HAR_FILE_REPOSITORY_HPP_
