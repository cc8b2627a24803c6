// recorder/repository/har_file_repository.cpp
#include "har_file_repository.hpp"
#include "repository/archive_file.hpp"
#include "repository/file_utils.hpp"
#include "har/http_archive.hpp"
#include "exception/recorder_exception.hpp"
#include <utility>

namespace httprec::recorder
{
  HarFileRepository::HarFileRepository(boost::filesystem::path directory,
                                       std::shared_ptr<InteractionAnonymizer> anonymizer)
    : directory_(std::move(directory)),
      anonymizer_(anonymizer ? std::move(anonymizer) : std::make_shared<NullAnonymizer>())
  {
  }

  boost::filesystem::path HarFileRepository::archive_path(const std::string& interaction_name) const
  {
    fs::path filename(make_valid_filename(interaction_name));
    if (!filename.has_extension())
    {
      filename += kFileExtension;
    }
    return directory_ / filename;
  }

  bool HarFileRepository::exists(const std::string& interaction_name)
  {
    return ArchiveFile(archive_path(interaction_name)).exists();
  }

  Interaction HarFileRepository::load(const std::string& interaction_name)
  {
    ArchiveFile file(archive_path(interaction_name));
    if (!file.exists())
    {
      throw NoSuchInteraction(interaction_name);
    }
    return har::from_archive(file.read(), interaction_name);
  }

  std::optional<Interaction> HarFileRepository::store(const Interaction& interaction)
  {
    if (interaction.messages.empty())
    {
      return std::nullopt;
    }

    auto anonymized = anonymizer_->anonymize(interaction);

    std::vector<har::Entry> entries;
    entries.reserve(anonymized.messages.size());
    for (const auto& message : anonymized.messages)
    {
      entries.push_back(har::to_entry(message));
    }

    ArchiveFile(archive_path(interaction.name)).append(entries);
    return anonymized;
  }
}
