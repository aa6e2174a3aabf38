/*
 * bulkget/src/transfer/descriptor_resolver.cpp
 *
 * Descriptor resolvers:
 * - EutilsResolver: NCBI efetch (db=sra, rettype=full) over libcurl, parsed by a small
 *   with Boost.PropertyTree's XML reader (attributes live under "<xmlattr>")
 * - ManifestResolver: offline JSON manifest via nlohmann::json
 * - RetryingResolver: applies a RetryPolicy around any resolver
 */

#include <bulkget/transfer/engine.hpp>
#include <bulkget/transfer/transfer.hpp>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bulkget::transfer {

namespace {

constexpr std::string_view kEfetchBase =
    "https://eutils.ncbi.nlm.nih.gov/entrez/eutils/efetch.fcgi?db=sra&rettype=full&retmode=xml";

// ---------------- efetch XML ----------------

using boost::property_tree::ptree;

// Depth-first, document-order walk collecting the attribute sets of every
// element named `name`.
void collectAttrs(const ptree& node, const std::string& name, std::vector<const ptree*>& out) {
    for (const auto& [key, child] : node) {
        if (key == "<xmlattr>" || key == "<xmlcomment>")
            continue;
        if (key == name) {
            static const ptree kNoAttrs;
            auto attrs = child.get_child_optional("<xmlattr>");
            out.push_back(attrs ? &attrs.get() : &kNoAttrs);
        }
        collectAttrs(child, name, out);
    }
}

std::vector<const ptree*> elements(const ptree& doc, const std::string& name) {
    std::vector<const ptree*> out;
    collectAttrs(doc, name, out);
    return out;
}

std::optional<std::string> attr(const ptree& attrs, const std::string& key) {
    auto v = attrs.get_optional<std::string>(key);
    return v ? std::optional<std::string>(*v) : std::nullopt;
}

std::optional<std::uint64_t> parseSize(const std::optional<std::string>& s) {
    if (!s || s->empty())
        return std::nullopt;
    try {
        std::size_t used = 0;
        auto v = std::stoull(*s, &used);
        if (used != s->size())
            return std::nullopt;
        return static_cast<std::uint64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ---------------- HTTP GET (text body) ----------------

size_t append_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string urlEscape(CURL* curl, std::string_view in) {
    char* esc = curl_easy_escape(curl, in.data(), static_cast<int>(in.size()));
    if (!esc)
        return std::string(in);
    std::string out(esc);
    curl_free(esc);
    return out;
}

class EutilsResolver final : public IDescriptorResolver {
public:
    EutilsResolver(LoggerPtr log, std::chrono::milliseconds timeout)
        : log_(log ? std::move(log) : nullLogger()), timeout_(timeout) {
        std::call_once(initOnce_, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }

    Expected<ObjectDescriptor> resolve(std::string_view identifier,
                                       const std::optional<std::string>& credential) override {
        if (identifier.empty())
            return Error{ErrorCode::InvalidArgument, "empty identifier"};

        CURL* curl = curl_easy_init();
        if (!curl)
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};

        std::string url(kEfetchBase);
        url += "&id=" + urlEscape(curl, identifier);
        if (credential && !credential->empty())
            url += "&api_key=" + urlEscape(curl, *credential);

        log_->debug("[{}] efetch GET", identifier);

        std::string body;
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 10000L);

        CURLcode rc = curl_easy_perform(curl);
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            const ErrorCode code =
                rc == CURLE_OPERATION_TIMEDOUT ? ErrorCode::Timeout : ErrorCode::NetworkError;
            return Error{code, std::string("efetch: ") + curl_easy_strerror(rc)};
        }
        if (status == 429 || status >= 500)
            return Error{ErrorCode::ServerError, "efetch HTTP status " + std::to_string(status)};
        if (status >= 400)
            return Error{ErrorCode::InvalidArgument, "efetch HTTP status " + std::to_string(status)};

        auto parsed = parseEfetchXml(body);
        if (!parsed.ok()) {
            if (parsed.error().code == ErrorCode::DescriptorNotFound)
                log_->warn("[{}] no AWS worldwide location listed", identifier);
            return parsed.error();
        }
        const auto& d = parsed.value();
        log_->debug("[{}] metadata parsed: Size={}, MD5={}", identifier, d.sizeBytes,
                    d.expected ? d.expected->hex : std::string("none"));
        return parsed;
    }

private:
    LoggerPtr log_;
    std::chrono::milliseconds timeout_;
    static inline std::once_flag initOnce_;
};

// ---------------- Manifest ----------------

class ManifestResolver final : public IDescriptorResolver {
public:
    explicit ManifestResolver(std::filesystem::path path) : path_(std::move(path)) {}

    Expected<ObjectDescriptor> resolve(std::string_view identifier,
                                       const std::optional<std::string>&) override {
        std::lock_guard<std::mutex> lk(mu_);
        if (!loaded_) {
            auto r = load();
            if (!r.ok())
                return r.error();
            loaded_ = true;
        }
        auto it = entries_.find(std::string(identifier));
        if (it == entries_.end()) {
            return Error{ErrorCode::DescriptorNotFound,
                         "identifier not in manifest: " + std::string(identifier)};
        }
        return it->second;
    }

private:
    Expected<void> load() {
        std::ifstream in(path_);
        if (!in) {
            return Error{ErrorCode::IoError, "cannot open manifest: " + path_.string()};
        }
        nlohmann::json root;
        try {
            in >> root;
        } catch (const nlohmann::json::exception& e) {
            return Error{ErrorCode::InvalidArgument,
                         "malformed manifest " + path_.string() + ": " + e.what()};
        }
        if (!root.is_object())
            return Error{ErrorCode::InvalidArgument, "manifest root must be an object"};

        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto& v = it.value();
            if (!v.is_object() || !v.contains("location") || !v["location"].is_string() ||
                !v.contains("size") || !v["size"].is_number_unsigned()) {
                return Error{ErrorCode::InvalidArgument,
                             "manifest entry '" + it.key() + "' needs location and size"};
            }
            ObjectDescriptor d;
            d.location = v["location"].get<std::string>();
            d.sizeBytes = v["size"].get<std::uint64_t>();
            if (v.contains("sha256") && v["sha256"].is_string()) {
                d.expected = Checksum{HashAlgo::Sha256, v["sha256"].get<std::string>()};
            } else if (v.contains("md5") && v["md5"].is_string()) {
                d.expected = Checksum{HashAlgo::Md5, v["md5"].get<std::string>()};
            }
            entries_.emplace(it.key(), std::move(d));
        }
        return Expected<void>{};
    }

    std::filesystem::path path_;
    std::mutex mu_;
    bool loaded_{false};
    std::unordered_map<std::string, ObjectDescriptor> entries_;
};

// ---------------- Retry wrapper ----------------

class RetryingResolver final : public IDescriptorResolver {
public:
    RetryingResolver(std::unique_ptr<IDescriptorResolver> inner, RetryPolicy policy,
                     LoggerPtr log, ShouldCancel shouldCancel)
        : inner_(std::move(inner)), policy_(std::move(policy)),
          log_(log ? std::move(log) : nullLogger()), shouldCancel_(std::move(shouldCancel)) {}

    Expected<ObjectDescriptor> resolve(std::string_view identifier,
                                       const std::optional<std::string>& credential) override {
        const int maxAttempts = std::max(1, policy_.maxAttempts);
        Error last{ErrorCode::Unknown, "no attempt made"};
        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            auto r = inner_->resolve(identifier, credential);
            if (r.ok())
                return r;
            last = r.error();
            if (last.code == ErrorCode::DescriptorNotFound ||
                last.code == ErrorCode::InvalidArgument || !policy_.shouldRetry(last))
                return last;
            if (attempt == maxAttempts)
                break;
            auto wait = policy_.backoffFor(attempt);
            log_->warn("[{}] metadata attempt {}/{} failed: {}; retrying in {} ms", identifier,
                       attempt, maxAttempts, last.message, wait.count());
            if (!sleepUnlessCancelled(wait, shouldCancel_))
                return Error{ErrorCode::Interrupted, "metadata lookup interrupted"};
        }
        log_->error("[{}] metadata lookup failed after {} attempts: {}", identifier, maxAttempts,
                    last.message);
        return last;
    }

private:
    std::unique_ptr<IDescriptorResolver> inner_;
    RetryPolicy policy_;
    LoggerPtr log_;
    ShouldCancel shouldCancel_;
};

} // namespace

Expected<ObjectDescriptor> parseEfetchXml(std::string_view xml) {
    ptree doc;
    try {
        std::istringstream in{std::string(xml)};
        boost::property_tree::read_xml(in, doc);
    } catch (const boost::property_tree::xml_parser_error& e) {
        return Error{ErrorCode::DescriptorNotFound,
                     std::string("unreadable efetch document: ") + e.what()};
    }

    std::optional<ObjectLocation> location;
    for (const auto* a : elements(doc, "Alternatives")) {
        auto org = attr(*a, "org");
        auto egress = attr(*a, "free_egress");
        auto url = attr(*a, "url");
        if (!org || !egress || !url || *org != "AWS" || *egress != "worldwide")
            continue;
        location = parseObjectLocation(*url);
        if (location)
            break;
    }
    if (!location) {
        return Error{ErrorCode::DescriptorNotFound, "no AWS worldwide alternative"};
    }

    ObjectDescriptor d;
    d.location = location->s3Uri();

    const std::string fileName = location->fileName();
    std::optional<std::uint64_t> size;
    for (const auto* f : elements(doc, "SRAFile")) {
        auto fn = attr(*f, "filename");
        if (!fn || *fn != fileName)
            continue;
        if (auto md5 = attr(*f, "md5"); md5 && !md5->empty())
            d.expected = Checksum{HashAlgo::Md5, *md5};
        size = parseSize(attr(*f, "size"));
        break;
    }
    if (!size || *size == 0) {
        if (auto runs = elements(doc, "RUN"); !runs.empty())
            size = parseSize(attr(*runs.front(), "size"));
    }
    if (!size) {
        return Error{ErrorCode::DescriptorNotFound, "object size not listed for " + fileName};
    }
    d.sizeBytes = *size;
    return d;
}

std::unique_ptr<IDescriptorResolver> makeEutilsResolver(LoggerPtr log,
                                                        std::chrono::milliseconds timeout) {
    return std::make_unique<EutilsResolver>(std::move(log), timeout);
}

std::unique_ptr<IDescriptorResolver> makeManifestResolver(const std::filesystem::path& manifest) {
    return std::make_unique<ManifestResolver>(manifest);
}

std::unique_ptr<IDescriptorResolver> makeRetryingResolver(std::unique_ptr<IDescriptorResolver> inner,
                                                          RetryPolicy policy, LoggerPtr log,
                                                          ShouldCancel shouldCancel) {
    return std::make_unique<RetryingResolver>(std::move(inner), std::move(policy), std::move(log),
                                              std::move(shouldCancel));
}

} // namespace bulkget::transfer
