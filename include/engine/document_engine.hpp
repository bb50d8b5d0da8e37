#ifndef PASTEBOX_ENGINE_DOCUMENT_ENGINE_HPP
#define PASTEBOX_ENGINE_DOCUMENT_ENGINE_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <boost/asio/thread_pool.hpp>
#include "crypto/document_crypto.hpp"
#include "crypto/random_source.hpp"
#include "engine/document.hpp"
#include "engine/engine_error.hpp"
#include "names/name_generator.hpp"
#include "render/highlighter.hpp"
#include "render/spam_filter.hpp"
#include "store/document_store.hpp"

namespace pastebox::engine {

struct EngineOptions {
  // Use stored bytes verbatim when they fail authentication and hold no 0x00
  bool allow_legacy_plaintext = true;
  // Threads running the background view counter
  std::size_t background_threads = 1;
};

// Write and read paths for encrypted documents
class DocumentEngine {
public:
  using ClockFunction = std::function<utils::TimePoint()>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  DocumentEngine(store::DocumentStore& store,
                 names::NameGenerator& names,
                 render::Highlighter& highlighter,
                 render::SpamFilter& spam_filter,
                 crypto::RandomSource& random,
                 EngineOptions options = {},
                 ClockFunction clock = [] { return utils::Clock::now(); });
  // Waits for scheduled view updates
  ~DocumentEngine();

  DocumentEngine(const DocumentEngine&) = delete;
  DocumentEngine& operator=(const DocumentEngine&) = delete;


  // ---- DOCUMENT OPERATIONS ----
  // Assigns id and upload, renders, encrypts and persists the document.
  // On return document.content holds the rendered form.
  void store(Document& document);
  // Fetches and decrypts a document. raw strips the rendered markup.
  // Throws store::NotFoundError, ExpiredError, crypto::CryptoError or store::StoreError.
  Document request(const std::string& id, bool raw);
  // Deletes a document, throws store::NotFoundError if it does not exist
  void remove(const std::string& id);


  // ---- BACKGROUND WORK ----
  // Blocks until every scheduled view update has finished
  void wait_for_background();

private:
  // ---- PARAMETERS ----
  store::DocumentStore& store_;
  names::NameGenerator& names_;
  render::Highlighter& highlighter_;
  render::SpamFilter& spam_filter_;
  crypto::RandomSource& random_;
  const EngineOptions options_;
  const ClockFunction clock_;

  // Background view counter
  boost::asio::thread_pool pool_;
  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::size_t pending_ = 0;


  // ---- WRITE PATH ----
  // Highlighted or escaped HTML for the normalized content
  std::string render(const Document& document);


  // ---- READ PATH ----
  // Fire-and-forget increment of the stored view counter
  void schedule_view_increment(const std::string& key);
  // Decrypts the stored content, honouring the legacy plaintext branch
  std::string decrypt_content(const std::string& id, const std::string& stored, utils::TimePoint upload);
  // Applies volatile deletion or hard expiration
  void evaluate_expiration(Document& document, const std::string& key, const std::string& expiration);
};

} // namespace pastebox::engine

#endif // PASTEBOX_ENGINE_DOCUMENT_ENGINE_HPP
