/**
 * @file internal_fs_bond_store.h
 * @brief Bond set persisted to nRF52 internal flash (LittleFS)
 * @version 1.0.0
 *
 * File format: one identifier per line, '\n' separated, no header.
 * A missing file loads as the empty set.
 */

#ifndef INTERNAL_FS_BOND_STORE_H
#define INTERNAL_FS_BOND_STORE_H

#include <Arduino.h>
#include "bond_store.h"
#include "config.h"

class InternalFsBondStore : public BondStore {
public:
    explicit InternalFsBondStore(const char* path = BOND_STORE_FILE);

    /**
     * @brief Mount the internal filesystem
     * @return true if mounted
     */
    bool begin();

    bool loadIdentifiers(BondSet& out) override;
    bool saveIdentifiers(const BondSet& identifiers) override;

    /**
     * @brief Delete the bond file
     */
    bool erase();

private:
    const char* _path;
    bool _mounted;
};

#endif // INTERNAL_FS_BOND_STORE_H
