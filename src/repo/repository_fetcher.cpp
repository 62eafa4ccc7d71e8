#include "repo/repository_fetcher.hpp"

#include "util/logger.hpp"

#include <cstdio>
#include <utility>

namespace fwsync {

namespace {

using json = nlohmann::json;

class RepositoryFileStream final : public IFileStream {
  public:
    RepositoryFileStream(const RepositoryFetcher& fetcher,
                         const RequestExecutor& executor,
                         RepositoryLocation repo,
                         std::vector<RemoteFile> files)
        : fetcher_(fetcher), executor_(executor), repo_(std::move(repo)), files_(std::move(files)) {}

    Result Next(DownloadedFile& out, bool& eof) override {
        out = DownloadedFile{};
        eof = false;
        if (next_ >= files_.size()) {
            eof = true;
            return Result::Ok();
        }

        const RemoteFile& file = files_[next_++];
        const std::string url = fetcher_.RawFileUrl(repo_, file.path);
        LogInfo("Downloading (%zu/%zu): %s", next_, files_.size(), url.c_str());

        HttpResponse response;
        auto r = executor_.Execute(HttpRequest::Get(url, RepositoryFetcher::AuthHeaders(repo_)),
                                   response);
        if (!r.is_ok())
            return Result::Wrap(r, "download " + file.path);

        out.file = file;
        out.bytes = std::move(response.body);
        return Result::Ok();
    }

    std::size_t FileCount() const override { return files_.size(); }

  private:
    const RepositoryFetcher& fetcher_;
    const RequestExecutor& executor_;
    RepositoryLocation repo_;
    std::vector<RemoteFile> files_;
    std::size_t next_ = 0;
};

} // namespace

std::string EncodeUrlPath(const std::string& path) {
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
                                c == '~' || c == '/';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

RepositoryFetcher::RepositoryFetcher(const RequestExecutor& executor)
    : RepositoryFetcher(executor, Options{}) {}

RepositoryFetcher::RepositoryFetcher(const RequestExecutor& executor, Options opt)
    : executor_(executor), opt_(std::move(opt)) {}

std::vector<HttpHeader> RepositoryFetcher::AuthHeaders(const RepositoryLocation& repo) {
    if (!repo.access_token)
        return {};
    return {{"Authorization", "Bearer " + *repo.access_token}};
}

std::string RepositoryFetcher::TreeUrl(const RepositoryLocation& repo) const {
    return opt_.api_base + "/repos/" + repo.owner + "/" + repo.name + "/git/trees/" +
           opt_.branch + "?recursive=1";
}

std::string RepositoryFetcher::RawFileUrl(const RepositoryLocation& repo,
                                          const std::string& path) const {
    return opt_.raw_base + "/" + repo.owner + "/" + repo.name + "/" + opt_.branch + "/" +
           EncodeUrlPath(path);
}

Result RepositoryFetcher::ListFiles(const RepositoryLocation& repo,
                                    std::vector<RemoteFile>& out) const {
    out.clear();

    auto headers = AuthHeaders(repo);
    headers.push_back({"Accept", "application/vnd.github+json"});

    HttpResponse response;
    auto r = executor_.Execute(HttpRequest::Get(TreeUrl(repo), std::move(headers)), response);
    if (!r.is_ok()) {
        // Unknown repository or branch: nothing to list.
        if (r.code() == ErrorCode::Protocol && response.status == 404)
            return Result::Ok();
        return r;
    }

    json body;
    try {
        body = json::parse(response.body);
    } catch (const json::parse_error& e) {
        return Result::Fail(ErrorCode::Protocol,
                            std::string("repository tree: invalid JSON response: ") + e.what());
    }

    if (!body.is_object())
        return Result::Fail(ErrorCode::Protocol, "repository tree response must be a JSON object");

    auto tree = body.find("tree");
    if (tree == body.end() || tree->is_null())
        return Result::Ok();
    if (!tree->is_array())
        return Result::Fail(ErrorCode::Protocol, "repository 'tree' must be an array");

    if (body.value("truncated", false)) {
        LogWarn("Repository tree listing for %s/%s is truncated", repo.owner.c_str(),
                repo.name.c_str());
    }

    for (const auto& item : *tree) {
        if (!item.is_object() || item.value("type", "") != "blob")
            continue;

        RemoteFile file;
        file.path = item.value("path", "");
        file.content_digest = item.value("sha", "");
        if (file.path.empty() || file.content_digest.empty()) {
            return Result::Fail(ErrorCode::Protocol,
                                "repository tree entry without path or sha: " + item.dump());
        }
        out.push_back(std::move(file));
    }
    return Result::Ok();
}

Result RepositoryFetcher::Open(const std::string& source_url, std::unique_ptr<IFileStream>& out) {
    out.reset();

    RepositoryLocation repo;
    auto pr = ParseRepositoryUrl(source_url, repo);
    if (!pr.is_ok())
        return pr;

    std::vector<RemoteFile> files;
    auto lr = ListFiles(repo, files);
    if (!lr.is_ok())
        return lr;

    if (files.empty()) {
        return Result::Fail(ErrorCode::EmptyRepository,
                            "Repository is empty. Does '" + opt_.branch + "' branch exist?");
    }

    LogInfo("Repository %s/%s lists %zu files on '%s'%s",
            repo.owner.c_str(),
            repo.name.c_str(),
            files.size(),
            opt_.branch.c_str(),
            repo.access_token ? " (authenticated)" : "");

    out = std::make_unique<RepositoryFileStream>(*this, executor_, std::move(repo), std::move(files));
    return Result::Ok();
}

} // namespace fwsync
