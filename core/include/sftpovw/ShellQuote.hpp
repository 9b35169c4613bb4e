// Citado de shell POSIX para la línea de comando de digest remota.
#pragma once
#include <string>
#include <vector>

namespace sftpovw {

// Cita word con comillas simples salvo que solo tenga caracteres que el shell
// no interpreta. La cadena vacía se convierte en ''.
std::string shellQuote(const std::string& word);

// Cita cada palabra y las une con un espacio.
std::string shellJoin(const std::vector<std::string>& words);

// Parte una línea de comando en palabras respetando comillas simples, dobles y
// escapes con barra invertida. Devuelve false si una comilla o escape queda abierto.
bool shellSplit(const std::string& line, std::vector<std::string>& out);

} // namespace sftpovw
