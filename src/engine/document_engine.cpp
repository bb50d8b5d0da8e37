#include "engine/document_engine.hpp"
#include "content/normalizer.hpp"
#include "render/html.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <limits>
#include <stdexcept>

namespace pastebox::engine {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DocumentEngine::DocumentEngine(store::DocumentStore& store,
                               names::NameGenerator& names,
                               render::Highlighter& highlighter,
                               render::SpamFilter& spam_filter,
                               crypto::RandomSource& random,
                               EngineOptions options,
                               ClockFunction clock)
  : store_(store)
  , names_(names)
  , highlighter_(highlighter)
  , spam_filter_(spam_filter)
  , random_(random)
  , options_(options)
  , clock_(std::move(clock))
  , pool_(options.background_threads > 0 ? options.background_threads : 1) {
  BOOST_LOG_TRIVIAL(info) << "Engine: Initialized (legacy plaintext "
                          << (options_.allow_legacy_plaintext ? "allowed" : "rejected") << ")";
}

DocumentEngine::~DocumentEngine() {
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Engine: Background pool stopped";
}


//==============================================
// DOCUMENT OPERATIONS
//==============================================

void DocumentEngine::store(Document& document) {
  // Generate a name that doesn't exist yet
  document.id = names_.generate_safe_name([this](const std::string& candidate) {
    return store_.has(crypto::hash_id(candidate));
  });
  const std::string key = crypto::hash_id(document.id);

  document.upload = utils::round_to_seconds(clock_());
  if (document.expiration) {
    document.expiration = utils::round_to_seconds(*document.expiration);
  }
  document.views = 0;

  document.content = content::normalize_content(document.content);

  if (document.syntax == "none") {
    document.syntax.clear();
  }
  std::string rendered = render(document);

  if (auto reason = spam_filter_.check(document, rendered)) {
    BOOST_LOG_TRIVIAL(warning) << "Engine: Spam filter hit for document: " << *reason;
    throw SpamRejectedError(*reason);
  }

  // Server-side encryption, the key only ever exists in memory
  crypto::Key content_key = crypto::derive_key(document.id, document.upload);
  store::StoredRecord record;
  try {
    record.content = crypto::encrypt(rendered, content_key, random_);
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: AES error: " << e.what();
    throw;
  }

  record.custom = document.custom;
  record.syntax = document.syntax;
  record.upload = utils::format_timestamp(document.upload);
  if (document.expiration) {
    record.expiration = utils::format_timestamp(*document.expiration);
  }
  record.views = 0;

  store_.put(key, record);
  document.content = std::move(rendered);

  BOOST_LOG_TRIVIAL(info) << "Engine: Stored document " << key << " uploaded " << record.upload;
}

Document DocumentEngine::request(const std::string& id, bool raw) {
  const std::string key = crypto::hash_id(id);

  store::StoredRecord record;
  try {
    record = store_.get(key);
  } catch (const store::NotFoundError&) {
    throw;
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Engine: Error retrieving document: " << e.what();
    throw;
  }

  if (record.views < 0 || record.views == std::numeric_limits<int64_t>::max()) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Corrupt view count for " << key << ": " << record.views;
    throw store::StoreError("Engine: Corrupt view count");
  }

  schedule_view_increment(key);

  Document document;
  document.id = id;
  document.custom = record.custom;
  document.syntax = record.syntax;
  // Count this read as well
  document.views = record.views + 1;

  try {
    document.upload = utils::parse_timestamp(record.upload);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Corrupt upload timestamp for " << key << ": " << e.what();
    throw store::StoreError("Engine: Corrupt upload timestamp");
  }

  document.content = decrypt_content(id, record.content, document.upload);

  if (record.expiration) {
    evaluate_expiration(document, key, *record.expiration);
  }

  if (raw) {
    document.content = render::strip_html(document.content);
  }
  return document;
}

void DocumentEngine::remove(const std::string& id) {
  const std::string key = crypto::hash_id(id);
  store_.remove(key);
  BOOST_LOG_TRIVIAL(info) << "Engine: Deleted document " << key;
}


//==============================================
// BACKGROUND WORK
//==============================================

void DocumentEngine::wait_for_background() {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  pending_cv_.wait(lock, [this] { return pending_ == 0; });
}


//==============================================
// WRITE PATH
//==============================================

std::string DocumentEngine::render(const Document& document) {
  if (!document.custom.empty()) {
    return render::escape_html(document.content);
  }

  try {
    return highlighter_.highlight(document.content, document.syntax);
  } catch (const render::HighlightError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Engine: Skipped syntax highlighting for the following reason: " << e.what();
    return render::escape_html(document.content);
  }
}


//==============================================
// READ PATH
//==============================================

void DocumentEngine::schedule_view_increment(const std::string& key) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    ++pending_;
  }

  boost::asio::post(pool_, [this, key]() {
    try {
      if (!store_.increment_views(key)) {
        BOOST_LOG_TRIVIAL(debug) << "Engine: View update skipped, record " << key << " is gone";
      }
    } catch (const std::exception& e) {
      // A lost view is acceptable
      BOOST_LOG_TRIVIAL(debug) << "Engine: View update failed for " << key << ": " << e.what();
    }

    {
      std::lock_guard<std::mutex> lock(pending_mutex_);
      --pending_;
    }
    pending_cv_.notify_all();
  });
}

std::string DocumentEngine::decrypt_content(const std::string& id, const std::string& stored, utils::TimePoint upload) {
  crypto::Key content_key;
  try {
    content_key = crypto::derive_key(id, upload);
    return crypto::decrypt(stored, content_key);
  } catch (const crypto::AuthenticationError& e) {
    // Documents from before encryption at rest are plain text
    if (options_.allow_legacy_plaintext && stored.find('\0') == std::string::npos) {
      BOOST_LOG_TRIVIAL(warning) << "Engine: Serving content without encryption as legacy plaintext";
      return stored;
    }
    BOOST_LOG_TRIVIAL(error) << "Engine: AES error: " << e.what();
    throw;
  } catch (const crypto::CryptoError& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: AES error: " << e.what();
    throw;
  }
}

void DocumentEngine::evaluate_expiration(Document& document, const std::string& key, const std::string& expiration) {
  try {
    document.expiration = utils::parse_timestamp(expiration);
  } catch (const std::invalid_argument& e) {
    BOOST_LOG_TRIVIAL(error) << "Engine: Corrupt expiration timestamp for " << key << ": " << e.what();
    throw store::StoreError("Engine: Corrupt expiration timestamp");
  }

  if (Document::is_volatile(*document.expiration)) {
    // views already includes this read, so a first read deletes the document
    if (document.views > 0) {
      try {
        store_.remove(key);
        BOOST_LOG_TRIVIAL(info) << "Engine: Deleted volatile document " << key;
      } catch (const store::StoreError& e) {
        BOOST_LOG_TRIVIAL(error) << "Engine: Couldn't delete volatile document: " << e.what();
      }
    }
    return;
  }

  if (*document.expiration < clock_()) {
    throw ExpiredError();
  }
}

} // namespace pastebox::engine
