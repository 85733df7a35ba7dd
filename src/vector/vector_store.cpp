#include <ragcore/vector/vector_store.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <mutex>

namespace ragcore::vector {

namespace {

std::string normalizeExtension(const std::string& extension) {
    std::string ext = extension;
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

bool VectorFilter::matches(DocumentId documentId, const std::string& filename) const {
    if (!document_ids.empty() && !document_ids.contains(documentId)) {
        return false;
    }
    if (extension.empty()) {
        return true;
    }
    auto dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return false;
    }
    return normalizeExtension(filename.substr(dot + 1)) == normalizeExtension(extension);
}

std::string VectorFilter::signature() const {
    std::string out = "ids=";
    bool first = true;
    for (auto id : document_ids) {
        if (!first) {
            out += ',';
        }
        out += std::to_string(id);
        first = false;
    }
    out += ";ext=" + normalizeExtension(extension);
    return out;
}

double cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        normA += static_cast<double>(a[i]) * a[i];
        normB += static_cast<double>(b[i]) * b[i];
    }
    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }
    return std::clamp(dot / (std::sqrt(normA) * std::sqrt(normB)), -1.0, 1.0);
}

Result<std::vector<VectorMatch>> InMemoryVectorStore::search(const Embedding& query, size_t topK,
                                                             const VectorFilter* filter) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (topK == 0 || records_.empty()) {
        return std::vector<VectorMatch>{};
    }
    if (query.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("query dimension {} does not match index dimension {}",
                                 query.size(), dimension_)};
    }

    std::vector<VectorMatch> matches;
    matches.reserve(records_.size());
    for (const auto& [chunkId, record] : records_) {
        if (filter && !filter->matches(record.document_id, record.filename)) {
            continue;
        }
        matches.push_back(VectorMatch{chunkId, cosineSimilarity(query, record.embedding)});
    }

    auto byScore = [](const VectorMatch& a, const VectorMatch& b) {
        if (a.similarity != b.similarity) {
            return a.similarity > b.similarity;
        }
        return a.chunk_id < b.chunk_id;
    };
    if (matches.size() > topK) {
        std::partial_sort(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(topK),
                          matches.end(), byScore);
        matches.resize(topK);
    } else {
        std::sort(matches.begin(), matches.end(), byScore);
    }
    return matches;
}

Result<void> InMemoryVectorStore::upsert(const VectorRecord& record) {
    if (record.chunk_id.empty() || record.embedding.empty()) {
        return Error{ErrorCode::InvalidArgument, "vector record needs a chunk id and embedding"};
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (records_.empty()) {
        dimension_ = record.embedding.size();
    } else if (record.embedding.size() != dimension_) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("embedding dimension {} does not match index dimension {}",
                                 record.embedding.size(), dimension_)};
    }
    records_[record.chunk_id] = record;
    return {};
}

Result<size_t> InMemoryVectorStore::removeDocument(DocumentId documentId) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    size_t removed = std::erase_if(records_, [documentId](const auto& entry) {
        return entry.second.document_id == documentId;
    });
    return removed;
}

Result<size_t> InMemoryVectorStore::size() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return records_.size();
}

} // namespace ragcore::vector
