#pragma once

#include "archive.hpp"
#include "crypto.hpp"
#include "prompt.hpp"
#include "staging.hpp"
#include "transport.hpp"
#include "types.h"

// Throws UsageError when the request cannot be sent as is.
void validate(const TransferRequest& request);

// RAW -> ARCHIVED? -> ENCRYPTED? -> TRANSMITTED -> PARSED
class SendPipeline {
   public:
    SendPipeline(Archiver& archiver, Cipher& cipher, Transport& transport, Prompter& prompter, StagingArea& staging)
        : m_archiver(archiver), m_cipher(cipher), m_transport(transport), m_prompter(prompter), m_staging(staging) {}

    TransferResult run(const TransferRequest& request);

   private:
    std::optional<std::string> resolve_key(const TransferRequest& request);
    void confirm(const TransferRequest& request, bool encrypted);

    Archiver& m_archiver;
    Cipher& m_cipher;
    Transport& m_transport;
    Prompter& m_prompter;
    StagingArea& m_staging;
};

// DOWNLOADING -> DECRYPTING? -> EXTRACTING? -> DONE
class ReceivePipeline {
   public:
    ReceivePipeline(Transport& transport, Cipher& cipher, Archiver& archiver, Prompter& prompter, StagingArea& staging)
        : m_transport(transport), m_cipher(cipher), m_archiver(archiver), m_prompter(prompter), m_staging(staging) {}

    ReceiveResult run(const ReceiveRequest& request);

   private:
    Transport& m_transport;
    Cipher& m_cipher;
    Archiver& m_archiver;
    Prompter& m_prompter;
    StagingArea& m_staging;
};

namespace Remote {
// Any 2xx is success; anything else throws NetworkError carrying the response body.
HttpReply delete_file(Transport& transport, const std::string& delete_url);

FileInfo info(Transport& transport, const std::string& url);
}  // namespace Remote
