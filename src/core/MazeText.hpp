/**
 * @file MazeText.hpp
 * @brief Leitura e escrita do formato texto de labirintos (uma linha por fileira, dígitos 0/1).
 */
#pragma once
#include <istream>
#include <optional>
#include <string>
#include "Grid.hpp"

namespace breach {

/**
 * @brief Interpreta um labirinto em texto.
 *
 * Cada linha não vazia é uma fileira. Espaços, tabs, vírgulas e colchetes são
 * separadores, então `0 1 0`, `010`, `0,1,0` e `[0, 1, 0],` são equivalentes.
 * Linhas iniciadas por `#` são comentários.
 *
 * @param in fluxo de entrada
 * @param defect saída opcional com o motivo da rejeição
 * @return matriz lida, ou std::nullopt (caractere inválido, fileiras irregulares, vazio)
 */
std::optional<Rows> parse_maze_text(std::istream& in, MazeDefect* defect = nullptr);

/** @brief Formata a matriz com dígitos separados por espaço, uma fileira por linha. */
std::string format_maze_text(const Rows& rows);

/**
 * @brief Carrega um arquivo de labirinto.
 * @param path caminho do arquivo
 * @param out ponteiro de saída
 * @param defect saída opcional com o motivo da rejeição
 * @return false se o arquivo não abriu ou o conteúdo é inválido
 */
bool load_maze_file(const std::string& path, Rows* out, MazeDefect* defect = nullptr);

/**
 * @brief Salva a matriz em arquivo (cria diretórios intermediários).
 * @return true em caso de sucesso
 */
bool save_maze_file(const std::string& path, const Rows& rows);

} // namespace breach
