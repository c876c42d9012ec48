#include "models.h"

namespace RecordSync {

void registerModelTypes(RecordFactory &factory)
{
    factory.registerType(MoleculeTemplate::EntityType, [](const QUuid &id) -> SyncableRecord* {
        return new MoleculeTemplate(id);
    });
    factory.registerType(MoleculeInstance::EntityType, [](const QUuid &id) -> SyncableRecord* {
        return new MoleculeInstance(id);
    });
    factory.registerType(AtomTemplate::EntityType, [](const QUuid &id) -> SyncableRecord* {
        return new AtomTemplate(id);
    });
}

} // namespace RecordSync
