/*
 * SPDX-FileCopyrightText: 2026 KDE Contributors
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#pragma once

#include "clouddrivedebug.h"
#include "clouddrivetypes.h"
#include "networkoperations.h"

#include <QSet>

#include <functional>
#include <optional>
#include <utility>

namespace CloudDrive
{
/**
 * Walks a server-paginated listing one page at a time.
 *
 * Each cycle asks the request builder for the request of the current token,
 * sends it, and hands the response to the page parser. Items of all pages are
 * accumulated in order. The run ends when the builder has no request, the
 * server returns no further token, or an error occurs; in the latter case
 * the items gathered so far are reported together with the error.
 *
 * A token that was already requested in the same run is a protocol error:
 * the run stops with PaginationProtocolError instead of looping forever.
 *
 * Destroying the paginator drops the in-flight request without reporting.
 */
template<typename T>
class Paginator
{
public:
    using RequestBuilder = std::function<std::optional<Request>(const PageToken &token)>;
    using PageParser = std::function<PageResult<T>(const Response &response)>;
    using Completion = std::function<void(const PageResult<T> &result)>;

    Paginator(QNetworkAccessManager *network, RequestBuilder requestBuilder, PageParser pageParser, ErrorMapper errorMapper = ErrorMapper())
        : m_operations(network)
        , m_requestBuilder(std::move(requestBuilder))
        , m_pageParser(std::move(pageParser))
        , m_errorMapper(std::move(errorMapper))
    {
    }

    /**
     * Starts a run. @p completion is called exactly once unless the paginator
     * is destroyed first; if the builder has no request for the first page it
     * is called before this returns.
     *
     * While a run is active, a further run is refused: its completion is
     * called right away with Unsupported and the active run goes on.
     */
    void runToCompletion(Completion completion)
    {
        if (m_running) {
            qCWarning(CLOUDDRIVE) << "Paginator is already running";
            if (completion) {
                PageResult<T> refused;
                refused.error = Error(Error::Unsupported, QStringLiteral("A listing is already running on this paginator"));
                completion(refused);
            }
            return;
        }

        m_completion = std::move(completion);
        m_items.clear();
        m_requestedTokens.clear();
        m_currentToken.reset();
        m_pageCount = 0;
        m_running = true;

        requestPage();
    }

    /**
     * Drops the in-flight request and reports Cancelled with the items
     * gathered so far.
     */
    void abort()
    {
        if (!m_running) {
            return;
        }
        m_operations.abort(std::exchange(m_pendingOperation, 0));
        finish(Error(Error::Cancelled, QStringLiteral("Listing aborted")));
    }

    bool isRunning() const
    {
        return m_running;
    }

    int pageCount() const
    {
        return m_pageCount;
    }

private:
    Q_DISABLE_COPY(Paginator)

    void requestPage()
    {
        const std::optional<Request> request = m_requestBuilder(m_currentToken);
        if (!request) {
            qCDebug(CLOUDDRIVE) << "No request for page token" << m_currentToken.value_or(QString()) << "- ending listing";
            finish(Error());
            return;
        }

        qCDebug(CLOUDDRIVE) << "Requesting page" << m_pageCount + 1 << request->request.url();
        m_pendingOperation = m_operations.send(*request, [this](const Response &response) {
            handlePage(response);
        });
    }

    void handlePage(const Response &response)
    {
        ++m_pageCount;
        m_pendingOperation = 0;

        if (const std::optional<Error> error = responseError(response, m_errorMapper)) {
            finish(*error);
            return;
        }

        PageResult<T> page = m_pageParser(response);
        m_items.append(page.items);

        if (page.error.isError()) {
            qCWarning(CLOUDDRIVE) << "Page" << m_pageCount << "could not be parsed:" << page.error;
            finish(page.error);
            return;
        }

        if (!page.nextToken) {
            qCDebug(CLOUDDRIVE) << "Listing complete after" << m_pageCount << "pages," << m_items.size() << "items";
            finish(Error());
            return;
        }

        const QString token = *page.nextToken;
        if (token == m_currentToken || m_requestedTokens.contains(token)) {
            qCWarning(CLOUDDRIVE) << "Server repeated page token" << token << "- aborting listing";
            Error error(Error::PaginationProtocolError, QStringLiteral("Server returned the page token \"%1\" more than once").arg(token));
            error.path = response.path;
            error.url = response.url;
            finish(error);
            return;
        }

        m_requestedTokens.insert(token);
        m_currentToken = page.nextToken;
        requestPage();
    }

    void finish(const Error &error)
    {
        m_running = false;

        PageResult<T> result;
        result.items = std::exchange(m_items, {});
        result.error = error;

        // The completion may destroy this paginator
        const Completion completion = std::exchange(m_completion, {});
        if (completion) {
            completion(result);
        }
    }

    NetworkOperations m_operations;
    RequestBuilder m_requestBuilder;
    PageParser m_pageParser;
    ErrorMapper m_errorMapper;
    Completion m_completion;

    QList<T> m_items;
    QSet<QString> m_requestedTokens;
    PageToken m_currentToken;
    quint64 m_pendingOperation = 0;
    int m_pageCount = 0;
    bool m_running = false;
};
}
