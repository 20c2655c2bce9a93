#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(hrCore, "hybridrec.core")
Q_LOGGING_CATEGORY(hrStore, "hybridrec.store")
Q_LOGGING_CATEGORY(hrProfile, "hybridrec.profile")
Q_LOGGING_CATEGORY(hrEmbedding, "hybridrec.embedding")
Q_LOGGING_CATEGORY(hrModel, "hybridrec.model")
Q_LOGGING_CATEGORY(hrRanking, "hybridrec.ranking")
Q_LOGGING_CATEGORY(hrIpc, "hybridrec.ipc")
