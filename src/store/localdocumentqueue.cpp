#include "localdocumentqueue.h"
#include "remoteservice.h"
#include "agentprofile.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>
#include <QUuid>
#include <QDebug>

#include <algorithm>
#include <exception>

namespace FieldSync {

namespace {

const QString kDefaultReceiptSeries = "CH";
const QString kDefaultInvoiceSeries = "FA";
const QString kCancelledNote = "Sending cancelled by user";

QList<Document> sortedByCreation(QList<Document> docs)
{
    std::stable_sort(docs.begin(), docs.end(), [](const Document &a, const Document &b) {
        return a.createdAt < b.createdAt;
    });
    return docs;
}

DocumentReference referenceOf(const Document &collection)
{
    DocumentReference ref;
    ref.partnerId = collection.partnerId;
    ref.series = collection.series;
    ref.number = collection.number;
    ref.documentCode = collection.documentCode;
    ref.date = collection.documentDate;
    return ref;
}

} // namespace

LocalDocumentQueue::LocalDocumentQueue(const QString &storeDirectory, QObject *parent)
    : DocumentQueueClient(parent)
    , m_storeDirectory(storeDirectory)
{
}

LocalDocumentQueue::~LocalDocumentQueue()
{
    delete m_remote;
}

void LocalDocumentQueue::setRemote(RemoteService *remote)
{
    if (m_remote == remote) {
        return;
    }
    delete m_remote;
    m_remote = remote;
    if (m_remote) {
        connect(m_remote, &RemoteService::logMessage, this, &LocalDocumentQueue::logMessage);
    }
}

QMap<QString, Document> &LocalDocumentQueue::documents(DocumentKind kind)
{
    return kind == DocumentKind::Invoice ? m_invoices : m_collections;
}

const QMap<QString, Document> &LocalDocumentQueue::documents(DocumentKind kind) const
{
    return kind == DocumentKind::Invoice ? m_invoices : m_collections;
}

QString LocalDocumentQueue::newId() const
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// ========== Persistence ==========

QString LocalDocumentQueue::stateFilePath() const
{
    return QDir(m_storeDirectory).filePath("queue.json");
}

bool LocalDocumentQueue::load()
{
    QFile file(stateFilePath());
    if (!file.exists()) {
        // Empty queue
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open queue: %1").arg(file.fileName()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse queue: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();

    m_invoices.clear();
    m_collections.clear();
    m_invoiceLines.clear();
    m_balances.clear();
    m_partners.clear();
    m_products.clear();

    int interrupted = 0;
    auto loadDocuments = [&interrupted](const QJsonArray &array, QMap<QString, Document> &target) {
        for (const QJsonValue &val : array) {
            Document document = Document::fromJson(val.toObject());
            if (document.status == DocumentStatus::Sending) {
                // A previous process died mid-send
                document.status = DocumentStatus::Failed;
                document.errorMessage = "Interrupted while sending";
                ++interrupted;
            }
            target.insert(document.id, document);
        }
    };
    loadDocuments(root["invoices"].toArray(), m_invoices);
    loadDocuments(root["collections"].toArray(), m_collections);

    QJsonObject lines = root["invoiceLines"].toObject();
    for (auto it = lines.begin(); it != lines.end(); ++it) {
        QList<InvoiceLine> invoiceLines;
        for (const QJsonValue &val : it.value().toArray()) {
            invoiceLines.append(InvoiceLine::fromJson(val.toObject()));
        }
        m_invoiceLines.insert(it.key(), invoiceLines);
    }

    for (const QJsonValue &val : root["balances"].toArray()) {
        m_balances.append(OutstandingBalance::fromJson(val.toObject()));
    }
    for (const QJsonValue &val : root["partners"].toArray()) {
        m_partners.append(Partner::fromJson(val.toObject()));
    }
    for (const QJsonValue &val : root["products"].toArray()) {
        m_products.append(Product::fromJson(val.toObject()));
    }

    m_partnersSyncedAt = QDateTime::fromString(root["partnersSyncedAt"].toString(), Qt::ISODate);
    m_productsSyncedAt = QDateTime::fromString(root["productsSyncedAt"].toString(), Qt::ISODate);

    qDebug() << "[LocalDocumentQueue] Loaded" << m_invoices.size() << "invoices,"
             << m_collections.size() << "collections," << m_balances.size() << "balances";

    if (interrupted > 0) {
        emit logMessage(QString("%1 document(s) were interrupted while sending and will be retried")
            .arg(interrupted));
        return save();
    }
    return true;
}

bool LocalDocumentQueue::save()
{
    QDir dir(m_storeDirectory);
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create store directory: %1").arg(m_storeDirectory));
        return false;
    }

    QJsonObject root;

    QJsonArray invoices;
    for (const Document &document : m_invoices) {
        invoices.append(document.toJson());
    }
    root["invoices"] = invoices;

    QJsonArray collections;
    for (const Document &document : m_collections) {
        collections.append(document.toJson());
    }
    root["collections"] = collections;

    QJsonObject lines;
    for (auto it = m_invoiceLines.constBegin(); it != m_invoiceLines.constEnd(); ++it) {
        QJsonArray invoiceLines;
        for (const InvoiceLine &line : it.value()) {
            invoiceLines.append(line.toJson());
        }
        lines[it.key()] = invoiceLines;
    }
    root["invoiceLines"] = lines;

    QJsonArray balances;
    for (const OutstandingBalance &balance : m_balances) {
        balances.append(balance.toJson());
    }
    root["balances"] = balances;

    QJsonArray partners;
    for (const Partner &partner : m_partners) {
        partners.append(partner.toJson());
    }
    root["partners"] = partners;

    QJsonArray products;
    for (const Product &product : m_products) {
        products.append(product.toJson());
    }
    root["products"] = products;

    root["partnersSyncedAt"] = m_partnersSyncedAt.toString(Qt::ISODate);
    root["productsSyncedAt"] = m_productsSyncedAt.toString(Qt::ISODate);
    root["version"] = 1;

    QSaveFile file(stateFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save queue: %1").arg(file.fileName()));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit queue: %1").arg(file.fileName()));
        return false;
    }
    return true;
}

// ========== Reference Data ==========

bool LocalDocumentQueue::hasReferenceData()
{
    return !m_partners.isEmpty();
}

SyncStatus LocalDocumentQueue::currentSyncStatus()
{
    SyncStatus status;
    status.isFirstRun = m_partners.isEmpty();
    status.partnersSyncedAt = m_partnersSyncedAt;
    status.productsSyncedAt = m_productsSyncedAt;
    return status;
}

QueueResult<SyncStatus> LocalDocumentQueue::syncReferenceData()
{
    if (!m_remote) {
        return QueueResult<SyncStatus>::failure("No remote service configured");
    }

    QueueResult<QList<Partner>> partners = m_remote->fetchPartners();
    if (!partners.success) {
        return QueueResult<SyncStatus>::failure(partners.errorMessage);
    }
    m_partners = partners.value;
    m_partnersSyncedAt = QDateTime::currentDateTime();

    QueueResult<QList<Product>> products = m_remote->fetchProducts();
    if (!products.success) {
        save();
        return QueueResult<SyncStatus>::failure(products.errorMessage);
    }
    m_products = products.value;
    m_productsSyncedAt = QDateTime::currentDateTime();

    if (!save()) {
        return QueueResult<SyncStatus>::failure("Failed to save reference data");
    }

    emit logMessage(QString("Reference data synced: %1 partner(s), %2 product(s)")
        .arg(m_partners.size()).arg(m_products.size()));
    return QueueResult<SyncStatus>::ok(currentSyncStatus());
}

// ========== Documents ==========

QueueResult<QList<Document>> LocalDocumentQueue::listDocuments(DocumentKind kind,
                                                               const QList<DocumentStatus> &statusFilter)
{
    QList<Document> result;
    for (const Document &document : documents(kind)) {
        if (statusFilter.isEmpty() || statusFilter.contains(document.status)) {
            result.append(document);
        }
    }
    return QueueResult<QList<Document>>::ok(sortedByCreation(result));
}

QueueResult<Document> LocalDocumentQueue::document(DocumentKind kind, const QString &id) const
{
    const QMap<QString, Document> &docs = documents(kind);
    auto it = docs.constFind(id);
    if (it == docs.constEnd()) {
        return QueueResult<Document>::failure(QString("Document not found: %1").arg(id));
    }
    return QueueResult<Document>::ok(it.value());
}

QueueResult<Document> LocalDocumentQueue::submitDocument(DocumentKind kind, const QString &id)
{
    QueueResult<Document> existing = document(kind, id);
    if (!existing.success) {
        return existing;
    }

    if (!existing.value.isOpen()) {
        // Already sending or delivered; a racing trigger must not resend it
        qDebug() << "[LocalDocumentQueue] Skipping" << id << "in status"
                 << documentStatusName(existing.value.status);
        return existing;
    }

    if (!m_remote) {
        return QueueResult<Document>::failure("No remote service configured");
    }

    if (kind == DocumentKind::Invoice) {
        return submitInvoice(id);
    }
    return submitCollectionGroup(existing.value.groupKey());
}

QueueResult<Document> LocalDocumentQueue::submitInvoice(const QString &id)
{
    Document &invoice = m_invoices[id];
    invoice.status = DocumentStatus::Sending;
    invoice.errorMessage.clear();
    save();
    emit documentChanged(DocumentKind::Invoice, id);

    RemoteSubmission submission;
    try {
        submission = m_remote->submitInvoice(invoice, m_invoiceLines.value(id));
    } catch (const std::exception &e) {
        submission = RemoteSubmission();
        submission.errorMessage = QString::fromUtf8(e.what());
    }

    // The remote call may have spun an event loop; look the invoice up again
    auto it = m_invoices.find(id);
    if (it == m_invoices.end()) {
        return QueueResult<Document>::failure(QString("Document removed while sending: %1").arg(id));
    }
    Document &current = it.value();

    if (submission.delivered()) {
        // Remote wins, even over a cancellation made while waiting
        current.status = DocumentStatus::Sent;
        current.sentAt = QDateTime::currentDateTime();
        current.remoteId = submission.remoteId;
        current.errorMessage.clear();
        emit logMessage(QString("Invoice %1 %2 sent").arg(current.series, current.number));
    } else if (current.status == DocumentStatus::Sending) {
        current.status = DocumentStatus::Failed;
        current.errorMessage = submission.errorMessage.isEmpty()
            ? QString("Submission failed") : submission.errorMessage;
        emit logMessage(QString("Invoice %1 %2 failed: %3")
            .arg(current.series, current.number, current.errorMessage));
    }

    save();
    emit documentChanged(DocumentKind::Invoice, id);
    return QueueResult<Document>::ok(current);
}

QStringList LocalDocumentQueue::groupRowIds(const QString &groupKey) const
{
    QStringList ids;
    for (const Document &row : m_collections) {
        if (row.groupKey() == groupKey) {
            ids.append(row.id);
        }
    }
    return ids;
}

void LocalDocumentQueue::applyGroupStatus(const QStringList &rowIds, DocumentStatus status,
                                          const QString &remoteId, const QString &error)
{
    for (const QString &rowId : rowIds) {
        auto it = m_collections.find(rowId);
        if (it == m_collections.end()) {
            continue;
        }
        Document &row = it.value();
        if (!DocumentLifecycle::canTransition(DocumentKind::Collection, row.status, status)) {
            qWarning() << "[LocalDocumentQueue] Illegal transition for" << rowId
                       << documentStatusName(row.status) << "->" << documentStatusName(status);
            continue;
        }
        row.status = status;
        if (status == DocumentStatus::Synced) {
            row.sentAt = QDateTime::currentDateTime();
            row.remoteId = remoteId;
            row.errorMessage.clear();
        } else if (status == DocumentStatus::Failed) {
            row.errorMessage = error;
        } else if (status == DocumentStatus::Sending) {
            row.errorMessage.clear();
        }
        emit documentChanged(DocumentKind::Collection, rowId);
    }
}

QueueResult<Document> LocalDocumentQueue::submitCollectionGroup(const QString &groupKey)
{
    QStringList rowIds;
    QList<Document> rows;
    for (const QString &rowId : groupRowIds(groupKey)) {
        if (m_collections.value(rowId).isOpen()) {
            rowIds.append(rowId);
            rows.append(m_collections.value(rowId));
        }
    }
    if (rows.isEmpty()) {
        return QueueResult<Document>::failure(QString("Receipt group has nothing to send: %1").arg(groupKey));
    }

    applyGroupStatus(rowIds, DocumentStatus::Sending, QString(), QString());
    save();

    const QString receipt = QString("%1 %2").arg(rows.first().receiptSeries, rows.first().receiptNumber);

    // Remote wins: a group it already holds is not sent again
    bool alreadyRecorded = false;
    try {
        QueueResult<bool> recorded = m_remote->isCollectionGroupRecorded(rows);
        if (recorded.success) {
            alreadyRecorded = recorded.value;
        } else {
            qDebug() << "[LocalDocumentQueue] Receipt lookup failed, sending anyway:" << recorded.errorMessage;
        }
    } catch (const std::exception &e) {
        qDebug() << "[LocalDocumentQueue] Receipt lookup threw, sending anyway:" << e.what();
    }

    RemoteSubmission submission;
    if (alreadyRecorded) {
        submission.alreadyRecorded = true;
    } else {
        try {
            submission = m_remote->submitCollectionGroup(rows);
        } catch (const std::exception &e) {
            submission = RemoteSubmission();
            submission.errorMessage = QString::fromUtf8(e.what());
        }
    }

    if (submission.delivered()) {
        applyGroupStatus(rowIds, DocumentStatus::Synced, submission.remoteId, QString());
        if (submission.accepted) {
            applyPaymentToBalances(rows);
        }
        emit logMessage(QString("Receipt %1 synced").arg(receipt));
    } else {
        const QString error = submission.errorMessage.isEmpty()
            ? QString("Submission failed") : submission.errorMessage;
        applyGroupStatus(rowIds, DocumentStatus::Failed, QString(), error);
        emit logMessage(QString("Receipt %1 failed: %2").arg(receipt, error));
    }

    save();
    return QueueResult<Document>::ok(m_collections.value(rowIds.first()));
}

QueueResult<QStringList> LocalDocumentQueue::submitAllPending(DocumentKind kind)
{
    if (!m_remote) {
        return QueueResult<QStringList>::failure("No remote service configured");
    }

    // Snapshot first; submissions change the map
    QStringList targets;
    for (const Document &document : listDocuments(kind, {DocumentStatus::Pending, DocumentStatus::Failed}).value) {
        const QString target = (kind == DocumentKind::Invoice) ? document.id : document.groupKey();
        if (!targets.contains(target)) {
            targets.append(target);
        }
    }

    const DocumentStatus delivered = DocumentLifecycle::deliveredStatus(kind);
    QStringList sent;
    for (const QString &target : targets) {
        if (kind == DocumentKind::Invoice) {
            QueueResult<Document> result = submitDocument(kind, target);
            if (result.success && result.value.status == delivered) {
                sent.append(target);
            }
            continue;
        }

        const QStringList before = groupRowIds(target);
        QueueResult<Document> result = submitCollectionGroup(target);
        if (!result.success) {
            continue;
        }
        for (const QString &rowId : before) {
            if (m_collections.value(rowId).status == delivered) {
                sent.append(rowId);
            }
        }
    }

    return QueueResult<QStringList>::ok(sent);
}

// ========== Balances & Collections ==========

OperationResult LocalDocumentQueue::syncBalances()
{
    if (!m_remote) {
        return OperationResult::failure("No remote service configured");
    }
    if (m_partners.isEmpty()) {
        return OperationResult::failure("No partners synced yet; run a full sync first");
    }

    const QString agentCode = m_profile ? m_profile->agentCode() : QString();
    QueueResult<QList<OutstandingBalance>> balances;
    try {
        balances = m_remote->fetchBalances(agentCode);
    } catch (const std::exception &e) {
        return OperationResult::failure(QString::fromUtf8(e.what()));
    }
    if (!balances.success) {
        return OperationResult::failure(balances.errorMessage);
    }

    m_balances = balances.value;
    if (!save()) {
        return OperationResult::failure("Failed to save balances");
    }

    emit logMessage(QString("Balances synced: %1 document(s)").arg(m_balances.size()));
    return OperationResult::ok();
}

OperationResult LocalDocumentQueue::syncCollections()
{
    QueueResult<QStringList> pushed = submitAllPending(DocumentKind::Collection);
    if (!pushed.success) {
        return OperationResult::failure(pushed.errorMessage);
    }

    QSet<QString> failedGroups;
    for (const Document &row : m_collections) {
        if (row.status == DocumentStatus::Failed) {
            failedGroups.insert(row.groupKey());
        }
    }
    if (!failedGroups.isEmpty()) {
        return OperationResult::failure(
            QString("%1 receipt group(s) could not be synced").arg(failedGroups.size()));
    }
    return OperationResult::ok();
}

void LocalDocumentQueue::applyPaymentToBalances(const QList<Document> &rows)
{
    for (const Document &row : rows) {
        const QString key = referenceOf(row).key();
        for (OutstandingBalance &balance : m_balances) {
            if (balance.key() == key) {
                balance.rest -= row.amount;
                if (balance.rest < Money()) {
                    balance.rest = Money();
                }
            }
        }
    }
}

QueueResult<QList<OutstandingBalance>> LocalDocumentQueue::outstandingBalances(const QString &partnerId)
{
    QList<OutstandingBalance> result;
    for (const OutstandingBalance &balance : m_balances) {
        if (!balance.rest.isPositive()) {
            continue;
        }
        if (!partnerId.isEmpty() && balance.partnerId != partnerId) {
            continue;
        }
        result.append(balance);
    }
    return QueueResult<QList<OutstandingBalance>>::ok(result);
}

bool LocalDocumentQueue::hasOpenCollectionFor(const DocumentReference &reference) const
{
    const QString key = reference.key();
    for (const Document &row : m_collections) {
        if ((row.status == DocumentStatus::Pending || row.status == DocumentStatus::Sending)
            && referenceOf(row).key() == key) {
            return true;
        }
    }
    return false;
}

QueueResult<QString> LocalDocumentQueue::createCollectionGroup(const CollectionGroupRequest &request)
{
    if (request.partnerId.isEmpty()) {
        return QueueResult<QString>::failure("Invalid partner for collection");
    }
    if (request.allocations.isEmpty()) {
        return QueueResult<QString>::failure("Select at least one invoice");
    }

    // Balances may have changed since the engine validated
    QList<OutstandingBalance> matched;
    QSet<QString> seenKeys;
    for (const BalanceAllocation &allocation : request.allocations) {
        const QString key = allocation.document.key();
        if (seenKeys.contains(key)) {
            return QueueResult<QString>::failure(
                QString("Invoice %1 appears more than once in the payment").arg(allocation.document.displayName()));
        }
        seenKeys.insert(key);
        auto it = std::find_if(m_balances.cbegin(), m_balances.cend(),
                               [&key](const OutstandingBalance &b) { return b.key() == key; });
        if (it == m_balances.cend()) {
            return QueueResult<QString>::failure(
                QString("Unknown balance: %1").arg(allocation.document.displayName()));
        }
        if (!allocation.requestedAmount.isPositive() || allocation.requestedAmount > it->rest) {
            return QueueResult<QString>::failure(
                QString("Invalid amount for %1").arg(allocation.document.displayName()));
        }
        if (hasOpenCollectionFor(allocation.document)) {
            return QueueResult<QString>::failure(
                QString("Invoice %1 already has a pending collection").arg(allocation.document.displayName()));
        }
        matched.append(*it);
    }

    QString receiptNumber;
    QString receiptSeries = kDefaultReceiptSeries;
    if (m_profile) {
        QueueResult<QString> number = m_profile->takeReceiptNumber();
        if (!number.success) {
            return QueueResult<QString>::failure(number.errorMessage);
        }
        receiptNumber = number.value;
        if (!m_profile->receiptSeries().isEmpty()) {
            receiptSeries = m_profile->receiptSeries();
        }
    } else {
        receiptNumber = QDateTime::currentDateTime().toString("yyyyMMddHHmmss");
    }

    const QString groupId = newId();
    const QDateTime now = QDateTime::currentDateTime();
    QStringList rowIds;

    for (int i = 0; i < request.allocations.size(); ++i) {
        const BalanceAllocation &allocation = request.allocations.at(i);
        const OutstandingBalance &balance = matched.at(i);

        Document row;
        row.id = newId();
        row.kind = DocumentKind::Collection;
        row.status = DocumentStatus::Pending;
        row.partnerId = request.partnerId;
        row.partnerName = request.partnerName.isEmpty() ? balance.partnerName : request.partnerName;
        row.series = balance.series;
        row.number = balance.number;
        row.documentCode = balance.documentCode;
        row.documentDate = balance.date;
        row.receiptGroupId = groupId;
        row.receiptSeries = receiptSeries;
        row.receiptNumber = receiptNumber;
        row.amount = allocation.requestedAmount;
        row.createdAt = now;

        m_collections.insert(row.id, row);
        rowIds.append(row.id);
    }

    if (!save()) {
        for (const QString &rowId : rowIds) {
            m_collections.remove(rowId);
        }
        return QueueResult<QString>::failure("Failed to save collection");
    }

    for (const QString &rowId : rowIds) {
        emit documentChanged(DocumentKind::Collection, rowId);
    }
    emit logMessage(QString("Receipt %1 %2 queued: %3 for %4 invoice(s)")
        .arg(receiptSeries, receiptNumber, request.total().toString())
        .arg(rowIds.size()));

    return QueueResult<QString>::ok(groupId);
}

// ========== Local Operations ==========

QueueResult<QString> LocalDocumentQueue::createInvoice(const InvoiceDraft &draft)
{
    if (draft.partnerId.isEmpty()) {
        return QueueResult<QString>::failure("Invalid partner for invoice");
    }
    if (draft.lines.isEmpty()) {
        return QueueResult<QString>::failure("Invoice has no lines");
    }
    for (const InvoiceLine &line : draft.lines) {
        if (line.quantity <= 0.0) {
            return QueueResult<QString>::failure(QString("Invalid quantity for %1").arg(line.productName));
        }
    }

    QString number;
    QString series = kDefaultInvoiceSeries;
    if (m_profile) {
        QueueResult<QString> taken = m_profile->takeInvoiceNumber();
        if (!taken.success) {
            return QueueResult<QString>::failure(taken.errorMessage);
        }
        number = taken.value;
        if (!m_profile->invoiceSeries().isEmpty()) {
            series = m_profile->invoiceSeries();
        }
    } else {
        number = QDateTime::currentDateTime().toString("yyyyMMddHHmmss");
    }

    Document invoice;
    invoice.id = newId();
    invoice.kind = DocumentKind::Invoice;
    invoice.status = DocumentStatus::Pending;
    invoice.partnerId = draft.partnerId;
    invoice.partnerName = draft.partnerName;
    invoice.locationId = draft.locationId;
    invoice.series = series;
    invoice.number = number;
    invoice.amount = draft.total();
    invoice.itemCount = draft.lines.size();
    invoice.notes = draft.notes;
    invoice.createdAt = QDateTime::currentDateTime();

    m_invoices.insert(invoice.id, invoice);
    m_invoiceLines.insert(invoice.id, draft.lines);

    if (!save()) {
        m_invoices.remove(invoice.id);
        m_invoiceLines.remove(invoice.id);
        return QueueResult<QString>::failure("Failed to save invoice");
    }

    emit documentChanged(DocumentKind::Invoice, invoice.id);
    emit logMessage(QString("Invoice %1 %2 created: %3").arg(series, number, invoice.amount.toString()));
    return QueueResult<QString>::ok(invoice.id);
}

OperationResult LocalDocumentQueue::cancelSending(const QString &invoiceId)
{
    auto it = m_invoices.find(invoiceId);
    if (it == m_invoices.end()) {
        return OperationResult::failure(QString("Document not found: %1").arg(invoiceId));
    }

    Document &invoice = it.value();
    if (!DocumentLifecycle::canTransition(DocumentKind::Invoice, invoice.status, DocumentStatus::Pending)) {
        return OperationResult::failure(QString("Invoice is not being sent (status: %1)")
            .arg(documentStatusName(invoice.status)));
    }

    invoice.status = DocumentStatus::Pending;
    invoice.errorMessage.clear();
    invoice.notes = invoice.notes.isEmpty()
        ? kCancelledNote : QString("%1\n%2").arg(invoice.notes, kCancelledNote);
    save();

    emit documentChanged(DocumentKind::Invoice, invoiceId);
    emit logMessage(QString("Sending cancelled for invoice %1 %2").arg(invoice.series, invoice.number));
    return OperationResult::ok();
}

OperationResult LocalDocumentQueue::deleteDocument(DocumentKind kind, const QString &id)
{
    QueueResult<Document> existing = document(kind, id);
    if (!existing.success) {
        return OperationResult::failure(existing.errorMessage);
    }

    QStringList ids;
    if (kind == DocumentKind::Collection) {
        ids = groupRowIds(existing.value.groupKey());
    } else {
        ids.append(id);
    }

    QMap<QString, Document> &docs = documents(kind);
    for (const QString &rowId : ids) {
        const DocumentStatus status = docs.value(rowId).status;
        if (status != DocumentStatus::Pending && status != DocumentStatus::Failed) {
            return OperationResult::failure(QString("Cannot delete a document that is %1")
                .arg(documentStatusName(status)));
        }
    }

    for (const QString &rowId : ids) {
        docs.remove(rowId);
        m_invoiceLines.remove(rowId);
    }

    if (!save()) {
        return OperationResult::failure("Failed to save queue");
    }

    for (const QString &rowId : ids) {
        emit documentChanged(kind, rowId);
    }
    return OperationResult::ok();
}

} // namespace FieldSync
