#pragma once

#include "engine/Metainfo.hpp"
#include "engine/SwarmEngine.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ts::test
{

inline engine::SessionInfo make_session(std::string hash, std::string name,
                                        std::vector<std::string> paths = {},
                                        std::uint64_t file_size = 1000)
{
    engine::SessionInfo session;
    session.hash = std::move(hash);
    session.name = std::move(name);
    session.has_metadata = true;
    if (paths.empty())
    {
        paths.push_back(session.name);
    }
    int index = 0;
    for (auto &path : paths)
    {
        engine::SessionFileInfo file;
        file.index = index++;
        auto slash = path.rfind('/');
        file.name = slash == std::string::npos ? path : path.substr(slash + 1);
        file.path = std::move(path);
        file.length = file_size;
        session.total_size += file_size;
        session.files.push_back(std::move(file));
    }
    return session;
}

inline std::string magnet_for(std::string const &hash)
{
    return "magnet:?xt=urn:btih:" + hash;
}

// In-memory SwarmEngine. Magnet links resolve through publish(); metainfo
// bytes are parsed for real. Adds and destroys complete synchronously
// unless held.
class FakeSwarmEngine final : public engine::SwarmEngine
{
  public:
    struct DestroyCall
    {
        std::string hash;
        bool delete_data = false;
    };

    void publish(std::string const &magnet, engine::SessionInfo session)
    {
        catalog_[magnet] = std::move(session);
    }

    // Puts a session straight into the registry, as if added earlier.
    void insert(engine::SessionInfo session)
    {
        auto hash = session.hash;
        sessions_[hash] = std::move(session);
    }

    void add(engine::AddSource source, engine::AddOptions options,
             engine::CancellationToken token,
             engine::AddCompletion completion) override
    {
        ++add_calls;
        last_add_options = options;
        std::optional<engine::SessionInfo> session;
        if (source.kind == engine::AddSource::Kind::Metainfo)
        {
            auto summary = engine::summarize_metainfo(source.bytes);
            if (!summary)
            {
                completion({engine::AddStatus::InvalidSource, std::nullopt,
                            "bad metainfo"});
                return;
            }
            std::vector<std::string> paths;
            for (auto const &file : summary->files)
            {
                paths.push_back(file.path);
            }
            session = make_session(summary->hash, summary->name, paths);
        }
        else if (auto it = catalog_.find(source.uri); it != catalog_.end())
        {
            session = it->second;
        }
        if (!session)
        {
            // Nobody in the swarm: the add never completes.
            unreachable_.push_back(std::move(token));
            return;
        }
        Pending pending{std::move(token), std::move(*session),
                        std::move(completion)};
        if (hold_adds)
        {
            held_adds_.push_back(std::move(pending));
            return;
        }
        finish_add(std::move(pending));
    }

    void release_adds()
    {
        auto held = std::move(held_adds_);
        held_adds_.clear();
        for (auto &pending : held)
        {
            finish_add(std::move(pending));
        }
    }

    std::optional<engine::SessionInfo>
    get(std::string const &hash) const override
    {
        auto it = sessions_.find(hash);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<engine::SessionInfo> list() const override
    {
        std::vector<engine::SessionInfo> out;
        for (auto const &[hash, session] : sessions_)
        {
            out.push_back(session);
        }
        return out;
    }

    void destroy(std::string const &hash, bool delete_data,
                 engine::DestroyCompletion completion) override
    {
        destroy_calls.push_back({hash, delete_data});
        if (hold_destroys)
        {
            held_destroys_.emplace_back(hash, std::move(completion));
            return;
        }
        auto removed = sessions_.erase(hash) > 0;
        completion(removed);
    }

    void release_destroys()
    {
        auto held = std::move(held_destroys_);
        held_destroys_.clear();
        for (auto &[hash, completion] : held)
        {
            auto removed = sessions_.erase(hash) > 0;
            completion(removed);
        }
    }

    engine::EngineTotals totals() const override
    {
        engine::EngineTotals totals;
        for (auto const &[hash, session] : sessions_)
        {
            totals.download_rate += session.download_rate;
            totals.upload_rate += session.upload_rate;
        }
        return totals;
    }

    bool select_file(std::string const &hash, int file_index) override
    {
        selected.emplace_back(hash, file_index);
        return sessions_.contains(hash);
    }

    engine::ReadResult read(std::string const &hash, int file_index,
                            std::uint64_t offset,
                            std::size_t max_bytes) override
    {
        ++read_calls;
        auto session = get(hash);
        if (!session || file_index < 0 ||
            static_cast<std::size_t>(file_index) >= session->files.size())
        {
            return {engine::ReadStatus::Gone, {}};
        }
        if (!piece_available)
        {
            return {engine::ReadStatus::Pending, {}};
        }
        auto length = session->files[static_cast<std::size_t>(file_index)]
                          .length;
        if (offset >= length)
        {
            return {engine::ReadStatus::Gone, {}};
        }
        auto count = static_cast<std::size_t>(
            std::min<std::uint64_t>(max_bytes, length - offset));
        return {engine::ReadStatus::Ok, std::vector<char>(count, 'x')};
    }

    std::size_t held_add_count() const noexcept
    {
        return held_adds_.size();
    }
    std::size_t held_destroy_count() const noexcept
    {
        return held_destroys_.size();
    }
    std::size_t session_count() const noexcept
    {
        return sessions_.size();
    }

    bool hold_adds = false;
    bool hold_destroys = false;
    bool piece_available = true;
    int add_calls = 0;
    int read_calls = 0;
    int cancelled_adds = 0;
    engine::AddOptions last_add_options;
    std::vector<DestroyCall> destroy_calls;
    std::vector<std::pair<std::string, int>> selected;

  private:
    struct Pending
    {
        engine::CancellationToken token;
        engine::SessionInfo session;
        engine::AddCompletion completion;
    };

    void finish_add(Pending pending)
    {
        if (pending.token.is_cancelled())
        {
            ++cancelled_adds;
            return;
        }
        auto hash = pending.session.hash;
        if (auto it = sessions_.find(hash); it != sessions_.end())
        {
            pending.completion(
                {engine::AddStatus::Duplicate, it->second, {}});
            return;
        }
        sessions_[hash] = pending.session;
        pending.completion(
            {engine::AddStatus::Ok, std::move(pending.session), {}});
    }

    std::map<std::string, engine::SessionInfo> catalog_;
    std::map<std::string, engine::SessionInfo> sessions_;
    std::vector<Pending> held_adds_;
    std::vector<std::pair<std::string, engine::DestroyCompletion>>
        held_destroys_;
    std::vector<engine::CancellationToken> unreachable_;
};

} // namespace ts::test
