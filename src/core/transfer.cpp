module;
#include <QObject>

module rawser.core.transfer;

TransferReply::TransferReply(QObject* parent)
    : QObject(parent)
{
}

bool TransferReply::isFinished() const
{
    return m_finished;
}

TransferResult TransferReply::result() const
{
    return m_result;
}

void TransferReply::setProgress(qint64 done, qint64 total)
{
    if (m_finished) return;
    emit progress(done, total);
}

void TransferReply::finish(const TransferResult& result)
{
    if (m_finished) return;
    m_finished = true;
    m_result = result;
    emit finished();
}
