#include "ExportSession.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <algorithm>

#include "ExportAssembler.h"
#include "ExportRenderer.h"

namespace StackComposer
{

    // 工作线程，只负责调用会话的导出流程
    class ExportWorker : public QThread
    {
    public:
        explicit ExportWorker(ExportSession *session)
            : m_session(session)
        {
        }

    protected:
        void run() override
        {
            m_session->runExport();
        }

    private:
        ExportSession *m_session;
    };

    std::string toString(ExportState state)
    {
        switch (state)
        {
        case ExportState::IDLE:
            return "idle";
        case ExportState::BUILDING:
            return "building";
        case ExportState::RENDERING:
            return "rendering";
        case ExportState::COMPLETED:
            return "completed";
        case ExportState::FAILED:
            return "failed";
        case ExportState::CANCELLED:
            return "cancelled";
        }
        return "unknown";
    }

    ExportSession::ExportSession(ExportDependencies dependencies, QObject *parent)
        : QObject(parent),
          m_dependencies(std::move(dependencies))
    {
        qRegisterMetaType<StackComposer::ExportState>("StackComposer::ExportState");
        connect(&m_progressTimer, &QTimer::timeout, this, &ExportSession::onProgressTimer);
    }

    ExportSession::~ExportSession()
    {
        cancel();
        if (m_worker)
        {
            m_worker->wait();
        }
    }

    bool ExportSession::start(CompositionSnapshot composition, const MediaLibrary &library,
                              const ExportSettings &settings, const std::string &outputPath)
    {
        if (state() != ExportState::IDLE)
        {
            qWarning() << "导出会话不在空闲状态，无法开始:" << QString::fromStdString(toString(state()));
            return false;
        }

        if (!composition)
        {
            QMutexLocker locker(&m_mutex);
            m_error = ExportError::make(ExportErrorKind::COMPOSITION_FAILED, "合成快照为空");
            return false;
        }

        if (!m_dependencies.probe || !m_dependencies.sources || !m_dependencies.encoderFactory)
        {
            QMutexLocker locker(&m_mutex);
            m_error = ExportError::make(ExportErrorKind::COMPOSITION_FAILED, "导出依赖不完整");
            return false;
        }

        if (m_worker)
        {
            m_worker->wait();
            m_worker.reset();
        }

        m_composition = std::move(composition);
        m_library = library;
        m_settings = settings;
        m_progress.reset();
        m_token.reset();
        m_lastReportedProgress = -1.0;
        {
            QMutexLocker locker(&m_mutex);
            m_error = ExportError();
            m_outputPath = outputPath.empty() ? defaultOutputPath(settings) : outputPath;
        }

        setState(ExportState::BUILDING);

        m_progressTimer.setInterval(std::max(1, settings.progressIntervalMs));
        m_progressTimer.start();

        m_worker = std::make_unique<ExportWorker>(this);
        m_worker->start();
        return true;
    }

    void ExportSession::cancel()
    {
        if (isActive())
        {
            qDebug() << "请求取消导出";
            m_token.cancel();
        }
    }

    bool ExportSession::reset()
    {
        if (state() == ExportState::IDLE)
        {
            return true;
        }
        if (!isTerminal())
        {
            qWarning() << "导出仍在进行，不能重置";
            return false;
        }

        if (m_worker)
        {
            m_worker->wait();
            m_worker.reset();
        }

        m_progressTimer.stop();
        m_progress.reset();
        m_token.reset();
        m_composition.reset();
        {
            QMutexLocker locker(&m_mutex);
            m_error = ExportError();
        }
        setState(ExportState::IDLE);
        return true;
    }

    bool ExportSession::waitForFinished(unsigned long msecs)
    {
        if (!m_worker)
        {
            return true;
        }
        return m_worker->wait(msecs);
    }

    bool ExportSession::isTerminal() const
    {
        const ExportState current = state();
        return current == ExportState::COMPLETED || current == ExportState::FAILED || current == ExportState::CANCELLED;
    }

    bool ExportSession::isActive() const
    {
        const ExportState current = state();
        return current == ExportState::BUILDING || current == ExportState::RENDERING;
    }

    ExportError ExportSession::error() const
    {
        QMutexLocker locker(&m_mutex);
        return m_error;
    }

    std::string ExportSession::outputPath() const
    {
        QMutexLocker locker(&m_mutex);
        return m_outputPath;
    }

    std::string ExportSession::defaultOutputPath(const ExportSettings &settings)
    {
        const QString fileName = QString("Stack_%1%2")
                                     .arg(QDateTime::currentMSecsSinceEpoch())
                                     .arg(QString::fromStdString(settings.fileExtension()));
        return QDir(QDir::tempPath()).filePath(fileName).toStdString();
    }

    void ExportSession::onProgressTimer()
    {
        const double current = progress();
        if (current != m_lastReportedProgress)
        {
            m_lastReportedProgress = current;
            emit progressChanged(current);
        }

        if (isTerminal())
        {
            m_progressTimer.stop();
        }
    }

    void ExportSession::runExport()
    {
        const std::string outputPath = this->outputPath();
        const QString finalPath = QString::fromStdString(outputPath);
        const QString partPath = finalPath + ".part";

        // 构建
        ExportAssembler assembler(*m_dependencies.probe);
        ExportTimeline timeline;
        if (!assembler.build(*m_composition, m_library, m_settings, timeline))
        {
            finish(ExportState::FAILED, assembler.error());
            return;
        }

        if (m_token.isCancelled())
        {
            finish(ExportState::CANCELLED, ExportError::make(ExportErrorKind::CANCELLED, "导出已取消"));
            return;
        }

        // 渲染
        setState(ExportState::RENDERING);

        std::unique_ptr<IFrameEncoder> encoder = m_dependencies.encoderFactory();
        if (!encoder)
        {
            finish(ExportState::FAILED, ExportError::make(ExportErrorKind::ENCODE_FAILED, "无法创建编码器"));
            return;
        }

        QFile::remove(partPath);
        ExportRenderer renderer(*m_dependencies.sources, *encoder);
        const ExportRenderer::Result result =
            renderer.render(timeline, m_settings, partPath.toStdString(), m_token, m_progress);

        if (result != ExportRenderer::Result::COMPLETED)
        {
            // 未完成的输出一律丢弃
            QFile::remove(partPath);
            const ExportState terminal =
                result == ExportRenderer::Result::CANCELLED ? ExportState::CANCELLED : ExportState::FAILED;
            finish(terminal, renderer.error());
            return;
        }

        // 编码收尾期间也可能收到取消
        if (m_token.isCancelled())
        {
            QFile::remove(partPath);
            finish(ExportState::CANCELLED, ExportError::make(ExportErrorKind::CANCELLED, "导出已取消"));
            return;
        }

        if (QFile::exists(finalPath))
        {
            QFile::remove(finalPath);
        }
        if (!QFile::rename(partPath, finalPath))
        {
            QFile::remove(partPath);
            finish(ExportState::FAILED,
                   ExportError::make(ExportErrorKind::SAVE_FAILED, "无法写入输出文件: " + outputPath));
            return;
        }

        if (m_token.isCancelled())
        {
            QFile::remove(finalPath);
            finish(ExportState::CANCELLED, ExportError::make(ExportErrorKind::CANCELLED, "导出已取消"));
            return;
        }

        // 只有成功完成才交给外部保存
        if (m_dependencies.sink)
        {
            std::string saveError;
            if (!m_dependencies.sink->save(outputPath, saveError))
            {
                finish(ExportState::FAILED,
                       ExportError::make(ExportErrorKind::SAVE_FAILED, "保存失败: " + saveError));
                return;
            }
        }

        m_progress.update(1.0);
        finish(ExportState::COMPLETED, ExportError());
    }

    void ExportSession::setState(ExportState state)
    {
        m_state.store(state);
        emit stateChanged(state);
    }

    void ExportSession::finish(ExportState state, const ExportError &error)
    {
        {
            QMutexLocker locker(&m_mutex);
            m_error = error;
        }
        setState(state);

        switch (state)
        {
        case ExportState::COMPLETED:
            qDebug() << "导出完成:" << QString::fromStdString(outputPath());
            emit completed(QString::fromStdString(outputPath()));
            break;
        case ExportState::CANCELLED:
            qDebug() << "导出已取消";
            emit cancelled();
            break;
        default:
            qWarning() << "导出失败 [" << QString::fromStdString(toString(error.kind)) << "]:"
                       << QString::fromStdString(error.reason);
            emit failed(QString::fromStdString(error.reason));
            break;
        }
    }

} // namespace StackComposer
