// Nombres temporales junto a una ruta destino, y búsqueda de los que dejan
// las transferencias interrumpidas.
//
// Los temporales remotos son "<destino>.<20 hex>"; los locales salen de
// mkstemp con la plantilla "<destino>.XXXXXX". La búsqueda no lleva registro:
// compara entradas del directorio por prefijo y longitud, así que también se
// reporta un archivo ajeno con la misma forma.
#pragma once
#include "SftpSession.hpp"
#include "SftpTypes.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace sftpovw {

constexpr int kTempNameAttempts = 10;
constexpr std::size_t kTempSuffixBytes = 10; // en hex: 20 caracteres

// Comprobación de existencia usada al elegir nombre. Devuelve false y rellena
// err si la propia comprobación falló.
using ExistsCheck =
    std::function<bool(const std::string& candidate, bool& exists, std::string& err)>;

// Cadena hex aleatoria en minúsculas de 2*bytes caracteres.
bool randomHexSuffix(std::size_t bytes, std::string& out, std::string& err);

// Hasta kTempNameAttempts candidatos "<target>.<sufijo>", cada uno comprobado
// con existsCheck. NamingExhausted si existen todos, TransferFailure si falla la
// comprobación, LocalIo si falla el generador aleatorio.
bool makeTempName(const std::string& target, const ExistsCheck& existsCheck,
                  std::string& out, OpError& err);

bool remoteTempName(SftpSession& session, const std::string& target,
                    std::string& out, OpError& err);

bool listRemoteTemporaries(SftpSession& session, const std::string& target,
                           std::vector<std::string>& out, OpError& err);

// Crea el archivo (vacío, modo 0600) para que el nombre quede reservado.
bool localTempName(const std::string& target, std::string& out, OpError& err);

bool listLocalTemporaries(const std::string& target,
                          std::vector<std::string>& out, OpError& err);

// Heurística de prefijo/longitud común a ambos listados.
bool looksLikeTemporary(const std::string& targetBase, const std::string& entry,
                        std::size_t tempNameLength);

} // namespace sftpovw
